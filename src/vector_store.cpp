#include "vector_store.hpp"

#include "vector_store_format.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace urlfeat {

namespace {

constexpr const char* BINARY_EXTENSION = ".ufv";

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool parse_header_line(const std::string& line, size_t& count, size_t& dim) {
    std::istringstream iss(line);
    std::string extra;
    return (iss >> count >> dim) && !(iss >> extra);
}

}

VectorStore::VectorStore(std::vector<std::string> words, std::vector<float> matrix,
                         size_t dimension, FallbackMode fallback)
    : words_(std::move(words)), matrix_(std::move(matrix)), dim_(dimension) {
    if (words_.empty() || dim_ == 0) {
        throw std::invalid_argument("Vector store is empty");
    }
    if (matrix_.size() != words_.size() * dim_) {
        throw std::invalid_argument("Vector matrix does not match vocabulary size");
    }

    rows_.reserve(words_.size());
    for (size_t i = 0; i < words_.size(); ++i) {
        // Duplicates resolve to their first row
        rows_.emplace(words_[i], i);
    }

    fallback_ = fallback == FallbackMode::MEAN ? mean_vector(matrix_, words_.size(), dim_)
                                               : std::vector<float>(dim_, 0.0f);
}

std::unique_ptr<VectorStore> VectorStore::load_text(const std::string& path, FallbackMode fallback) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open vector file: " + path);
    }

    std::vector<std::string> words;
    std::vector<float> matrix;
    size_t dim = 0;

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        size_t header_count = 0;
        size_t header_dim = 0;
        if (line_no == 1 && parse_header_line(line, header_count, header_dim)) {
            dim = header_dim;
            words.reserve(header_count);
            matrix.reserve(header_count * header_dim);
            continue;
        }

        std::istringstream iss(line);
        std::string word;
        iss >> word;

        size_t before = matrix.size();
        float value;
        while (iss >> value) {
            matrix.push_back(value);
        }
        size_t row_dim = matrix.size() - before;

        if (dim == 0) dim = row_dim;
        if (row_dim != dim) {
            throw std::runtime_error("Line " + std::to_string(line_no) + " of " + path +
                                     " has " + std::to_string(row_dim) +
                                     " values, expected " + std::to_string(dim));
        }
        words.push_back(std::move(word));
    }

    return std::make_unique<VectorStore>(std::move(words), std::move(matrix), dim, fallback);
}

std::unique_ptr<VectorStore> VectorStore::load_binary(const std::string& path, FallbackMode fallback) {
    VectorStoreReader reader(path);
    if (!reader.open()) {
        throw std::runtime_error("Cannot open vector store: " + path);
    }

    auto words = reader.load_vocabulary();
    auto matrix = reader.load_matrix();
    size_t dim = reader.header().dimension;
    reader.close();

    return std::make_unique<VectorStore>(std::move(words), std::move(matrix), dim, fallback);
}

std::unique_ptr<VectorStore> VectorStore::load(const std::string& path, FallbackMode fallback) {
    if (ends_with(path, BINARY_EXTENSION)) {
        return load_binary(path, fallback);
    }
    return load_text(path, fallback);
}

void VectorStore::save(const std::string& path) const {
    VectorStoreWriter writer(path);
    writer.write_vocabulary(words_);
    writer.write_matrix(matrix_, static_cast<uint32_t>(dim_));
    writer.finalize();
}

const float* VectorStore::lookup(const std::string& token) const {
    auto it = rows_.find(token);
    if (it == rows_.end()) {
        return nullptr;
    }
    return matrix_.data() + it->second * dim_;
}

}
