#pragma once

#include <memory>
#include <string>
#include <vector>

#include "embedding_index.hpp"
#include "url_data.hpp"

namespace urlfeat {

struct Matrix {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<float> data;

    Matrix() = default;
    Matrix(size_t r, size_t c) : rows(r), cols(c), data(r * c, 0.0f) {}

    float* row(size_t i) { return data.data() + i * cols; }
    const float* row(size_t i) const { return data.data() + i * cols; }
    float at(size_t r, size_t c) const { return data[r * cols + c]; }

    std::vector<float> row_vector(size_t i) const {
        return std::vector<float>(row(i), row(i) + cols);
    }

    bool is_zero() const;
};

enum class Layout {
    POSITIONAL,   // every zone at a fixed offset
    SEQUENTIAL    // zones concatenated, then padded or truncated once
};

Layout parse_layout(const std::string& name);
std::string to_string(Layout layout);

struct ZoneCapacities {
    size_t sub_domain = 5;
    size_t main_domain = 5;
    size_t path = 10;
    size_t args = 10;

    // Rows of the embedding matrix; one extra row for the TLD
    size_t total() const { return sub_domain + main_domain + 1 + path + args; }

    void validate() const;
};

class EmbeddingMatrixBuilder {
public:
    EmbeddingMatrixBuilder(std::shared_ptr<const EmbeddingIndex> index, std::string prefix);

    // Vector of prefix + token, or the fallback vector on a miss
    const float* embed(const std::string& token) const;

    Matrix build(const UrlData& data, const ZoneCapacities& capacities, Layout layout) const;

    size_t dimension() const { return index_->dimension(); }
    const EmbeddingIndex& index() const { return *index_; }

private:
    std::shared_ptr<const EmbeddingIndex> index_;
    std::string prefix_;

    // Writes up to capacity leading tokens at row offset; the rest stays zero
    void fill_block(Matrix& matrix, size_t offset, const std::vector<std::string>& tokens,
                    size_t capacity) const;
};

}
