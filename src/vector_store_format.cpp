#include "vector_store_format.hpp"

#include <limits>
#include <stdexcept>

namespace urlfeat {

void StoreHeader::write(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(&magic), 4);
    out.write(reinterpret_cast<const char*>(&version_major), 2);
    out.write(reinterpret_cast<const char*>(&version_minor), 2);
    out.write(reinterpret_cast<const char*>(&flags), 4);
    out.write(reinterpret_cast<const char*>(&num_words), 4);
    out.write(reinterpret_cast<const char*>(&dimension), 4);
    out.write(reinterpret_cast<const char*>(&reserved), 4);
    out.write(reinterpret_cast<const char*>(&matrix_offset), 8);
}

void StoreHeader::read(std::istream& in) {
    in.read(reinterpret_cast<char*>(&magic), 4);
    in.read(reinterpret_cast<char*>(&version_major), 2);
    in.read(reinterpret_cast<char*>(&version_minor), 2);
    in.read(reinterpret_cast<char*>(&flags), 4);
    in.read(reinterpret_cast<char*>(&num_words), 4);
    in.read(reinterpret_cast<char*>(&dimension), 4);
    in.read(reinterpret_cast<char*>(&reserved), 4);
    in.read(reinterpret_cast<char*>(&matrix_offset), 8);
}

VectorStoreWriter::VectorStoreWriter(const std::string& path) : path_(path) {
    file_.open(path, std::ios::binary);
    if (!file_) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    char zeros[StoreHeader::SIZE] = {0};
    file_.write(zeros, StoreHeader::SIZE);
}

VectorStoreWriter::~VectorStoreWriter() {
    if (file_.is_open()) {
        file_.close();
    }
}

void VectorStoreWriter::write_vocabulary(const std::vector<std::string>& words) {
    header_.num_words = static_cast<uint32_t>(words.size());

    for (const auto& word : words) {
        if (word.size() > std::numeric_limits<uint16_t>::max()) {
            throw std::runtime_error("Word too long for vector store: " + word.substr(0, 32));
        }
        uint16_t len = static_cast<uint16_t>(word.size());
        file_.write(reinterpret_cast<const char*>(&len), 2);
        file_.write(word.data(), len);
    }
}

void VectorStoreWriter::write_matrix(const std::vector<float>& matrix, uint32_t dimension) {
    if (dimension == 0 || matrix.size() != static_cast<size_t>(header_.num_words) * dimension) {
        throw std::runtime_error("Matrix size does not match vocabulary in " + path_);
    }
    header_.dimension = dimension;
    header_.matrix_offset = static_cast<uint64_t>(file_.tellp());
    file_.write(reinterpret_cast<const char*>(matrix.data()),
                static_cast<std::streamsize>(matrix.size() * sizeof(float)));
}

void VectorStoreWriter::finalize() {
    file_.seekp(0);
    header_.write(file_);
    file_.close();
    if (file_.fail()) {
        throw std::runtime_error("Failed writing vector store: " + path_);
    }
}

VectorStoreReader::VectorStoreReader(const std::string& path) : path_(path) {}

VectorStoreReader::~VectorStoreReader() {
    close();
}

bool VectorStoreReader::open() {
    file_.open(path_, std::ios::binary);
    if (!file_) {
        return false;
    }

    header_.read(file_);

    if (!file_ || header_.magic != STORE_MAGIC_NUMBER ||
        header_.version_major != STORE_VERSION_MAJOR) {
        file_.close();
        return false;
    }

    return true;
}

void VectorStoreReader::close() {
    if (file_.is_open()) {
        file_.close();
    }
}

std::vector<std::string> VectorStoreReader::load_vocabulary() {
    file_.seekg(StoreHeader::SIZE);

    std::vector<std::string> words;
    words.reserve(header_.num_words);
    for (uint32_t i = 0; i < header_.num_words; ++i) {
        uint16_t len = 0;
        file_.read(reinterpret_cast<char*>(&len), 2);

        std::string word(len, '\0');
        file_.read(word.data(), len);
        if (!file_) {
            throw std::runtime_error("Truncated vocabulary in " + path_);
        }
        words.push_back(std::move(word));
    }
    return words;
}

std::vector<float> VectorStoreReader::load_matrix() {
    file_.seekg(static_cast<std::streamoff>(header_.matrix_offset));

    std::vector<float> matrix(static_cast<size_t>(header_.num_words) * header_.dimension);
    file_.read(reinterpret_cast<char*>(matrix.data()),
               static_cast<std::streamsize>(matrix.size() * sizeof(float)));
    if (!file_) {
        throw std::runtime_error("Truncated vector matrix in " + path_);
    }
    return matrix;
}

}
