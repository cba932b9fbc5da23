#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace urlfeat {

// Vector used for out-of-vocabulary tokens
enum class FallbackMode {
    MEAN,   // mean of all vectors
    ZERO    // families that model unknown tokens themselves
};

/**
 * Read-only token -> vector lookup shared by all featurization calls.
 */
class EmbeddingIndex {
public:
    virtual ~EmbeddingIndex() = default;

    // Row of dimension() floats, or nullptr when token is not in the vocabulary
    virtual const float* lookup(const std::string& token) const = 0;

    virtual size_t dimension() const = 0;
    virtual size_t size() const = 0;
    virtual const std::vector<float>& fallback_vector() const = 0;

    bool contains(const std::string& token) const { return lookup(token) != nullptr; }
};

// Per-column mean of row-major vectors
std::vector<float> mean_vector(const std::vector<float>& matrix, size_t rows, size_t dim);

/**
 * Small word -> vector table, used for the sample embedding and in tests.
 */
class InMemoryEmbeddingIndex : public EmbeddingIndex {
public:
    explicit InMemoryEmbeddingIndex(std::unordered_map<std::string, std::vector<float>> vectors,
                                    FallbackMode fallback = FallbackMode::MEAN);

    // Space separated "word v1 ... vD" lines, no header
    static std::unique_ptr<InMemoryEmbeddingIndex> load(const std::string& path,
                                                        FallbackMode fallback = FallbackMode::MEAN);

    const float* lookup(const std::string& token) const override;
    size_t dimension() const override { return dim_; }
    size_t size() const override { return vectors_.size(); }
    const std::vector<float>& fallback_vector() const override { return fallback_; }

private:
    std::unordered_map<std::string, std::vector<float>> vectors_;
    size_t dim_ = 0;
    std::vector<float> fallback_;
};

}
