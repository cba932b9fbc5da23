#include "embedding_index.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace urlfeat {

std::vector<float> mean_vector(const std::vector<float>& matrix, size_t rows, size_t dim) {
    std::vector<double> sum(dim, 0.0);
    for (size_t r = 0; r < rows; ++r) {
        const float* row = matrix.data() + r * dim;
        for (size_t c = 0; c < dim; ++c) {
            sum[c] += row[c];
        }
    }

    std::vector<float> mean(dim, 0.0f);
    if (rows == 0) return mean;
    for (size_t c = 0; c < dim; ++c) {
        mean[c] = static_cast<float>(sum[c] / static_cast<double>(rows));
    }
    return mean;
}

InMemoryEmbeddingIndex::InMemoryEmbeddingIndex(
    std::unordered_map<std::string, std::vector<float>> vectors, FallbackMode fallback)
    : vectors_(std::move(vectors)) {
    if (vectors_.empty()) {
        throw std::invalid_argument("Embedding table is empty");
    }

    dim_ = vectors_.begin()->second.size();
    if (dim_ == 0) {
        throw std::invalid_argument("Embedding vectors have zero dimension");
    }

    std::vector<float> flat;
    flat.reserve(vectors_.size() * dim_);
    for (const auto& [word, vec] : vectors_) {
        if (vec.size() != dim_) {
            throw std::invalid_argument("Vector for '" + word + "' has dimension " +
                                        std::to_string(vec.size()) + ", expected " +
                                        std::to_string(dim_));
        }
        flat.insert(flat.end(), vec.begin(), vec.end());
    }

    fallback_ = fallback == FallbackMode::MEAN ? mean_vector(flat, vectors_.size(), dim_)
                                               : std::vector<float>(dim_, 0.0f);
}

std::unique_ptr<InMemoryEmbeddingIndex> InMemoryEmbeddingIndex::load(const std::string& path,
                                                                     FallbackMode fallback) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open embedding file: " + path);
    }

    std::unordered_map<std::string, std::vector<float>> vectors;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        std::string word;
        if (!(iss >> word)) continue;

        std::vector<float> vec;
        float value;
        while (iss >> value) {
            vec.push_back(value);
        }
        if (!vec.empty()) {
            vectors[word] = std::move(vec);
        }
    }

    return std::make_unique<InMemoryEmbeddingIndex>(std::move(vectors), fallback);
}

const float* InMemoryEmbeddingIndex::lookup(const std::string& token) const {
    auto it = vectors_.find(token);
    if (it == vectors_.end()) {
        return nullptr;
    }
    return it->second.data();
}

}
