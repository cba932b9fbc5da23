#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "embedding_index.hpp"

namespace urlfeat {

/**
 * Pretrained vectors held in one contiguous row-major matrix.
 * Loads word2vec / GloVe / fastText text files or the binary store
 * written by save().
 */
class VectorStore : public EmbeddingIndex {
public:
    VectorStore(std::vector<std::string> words, std::vector<float> matrix, size_t dimension,
                FallbackMode fallback);

    // Text format; an optional "count dim" first line is skipped
    static std::unique_ptr<VectorStore> load_text(const std::string& path, FallbackMode fallback);

    static std::unique_ptr<VectorStore> load_binary(const std::string& path, FallbackMode fallback);

    // Picks the binary reader for ".ufv" files, the text reader otherwise
    static std::unique_ptr<VectorStore> load(const std::string& path, FallbackMode fallback);

    void save(const std::string& path) const;

    const float* lookup(const std::string& token) const override;
    size_t dimension() const override { return dim_; }
    size_t size() const override { return words_.size(); }
    const std::vector<float>& fallback_vector() const override { return fallback_; }

    const std::vector<std::string>& words() const { return words_; }

private:
    std::vector<std::string> words_;
    std::vector<float> matrix_;
    size_t dim_;
    std::unordered_map<std::string, size_t> rows_;
    std::vector<float> fallback_;
};

}
