#include "embedding_matrix.hpp"

#include "lexical.hpp"

#include <algorithm>
#include <stdexcept>

namespace urlfeat {

bool Matrix::is_zero() const {
    return std::all_of(data.begin(), data.end(), [](float v) { return v == 0.0f; });
}

Layout parse_layout(const std::string& name) {
    const std::string lowered = to_lower(trim(name));
    if (lowered == "positional") return Layout::POSITIONAL;
    if (lowered == "sequential") return Layout::SEQUENTIAL;
    throw std::invalid_argument("Unknown matrix layout: " + name);
}

std::string to_string(Layout layout) {
    return layout == Layout::POSITIONAL ? "positional" : "sequential";
}

void ZoneCapacities::validate() const {
    if (sub_domain == 0 || main_domain == 0 || path == 0 || args == 0) {
        throw std::invalid_argument("Zone capacities must be positive");
    }
}

EmbeddingMatrixBuilder::EmbeddingMatrixBuilder(std::shared_ptr<const EmbeddingIndex> index,
                                               std::string prefix)
    : index_(std::move(index)), prefix_(std::move(prefix)) {
    if (!index_) {
        throw std::invalid_argument("EmbeddingMatrixBuilder requires an embedding index");
    }
}

const float* EmbeddingMatrixBuilder::embed(const std::string& token) const {
    const float* vec = prefix_.empty() ? index_->lookup(token) : index_->lookup(prefix_ + token);
    return vec ? vec : index_->fallback_vector().data();
}

void EmbeddingMatrixBuilder::fill_block(Matrix& matrix, size_t offset,
                                        const std::vector<std::string>& tokens,
                                        size_t capacity) const {
    size_t count = std::min(tokens.size(), capacity);
    for (size_t i = 0; i < count; ++i) {
        const float* vec = embed(tokens[i]);
        std::copy(vec, vec + matrix.cols, matrix.row(offset + i));
    }
}

Matrix EmbeddingMatrixBuilder::build(const UrlData& data, const ZoneCapacities& capacities,
                                     Layout layout) const {
    Matrix matrix(capacities.total(), dimension());
    const std::vector<std::string> tld = {data.domains.domain_ending};
    const std::vector<std::string> args = flatten_args(data.args);

    if (layout == Layout::SEQUENTIAL) {
        std::vector<std::string> tokens;
        append(tokens, data.domains.sub_domains);
        append(tokens, data.domains.main_domain);
        append(tokens, tld);
        append(tokens, data.path);
        append(tokens, args);
        fill_block(matrix, 0, tokens, matrix.rows);
        return matrix;
    }

    size_t offset = 0;
    fill_block(matrix, offset, data.domains.sub_domains, capacities.sub_domain);
    offset += capacities.sub_domain;
    fill_block(matrix, offset, data.domains.main_domain, capacities.main_domain);
    offset += capacities.main_domain;
    fill_block(matrix, offset, tld, 1);
    offset += 1;
    fill_block(matrix, offset, data.path, capacities.path);
    offset += capacities.path;
    fill_block(matrix, offset, args, capacities.args);
    return matrix;
}

}
