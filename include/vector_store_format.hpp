#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace urlfeat {

constexpr uint32_t STORE_MAGIC_NUMBER = 0x31564655;  // "UFV1"
constexpr uint16_t STORE_VERSION_MAJOR = 1;
constexpr uint16_t STORE_VERSION_MINOR = 0;

struct StoreHeader {
    uint32_t magic = STORE_MAGIC_NUMBER;
    uint16_t version_major = STORE_VERSION_MAJOR;
    uint16_t version_minor = STORE_VERSION_MINOR;
    uint32_t flags = 0;
    uint32_t num_words = 0;
    uint32_t dimension = 0;
    uint32_t reserved = 0;
    uint64_t matrix_offset = 0;

    static constexpr size_t SIZE = 32;

    void write(std::ostream& out) const;
    void read(std::istream& in);
};

/**
 * Binary vector store layout:
 *   header (32 bytes) | vocabulary (u16 length + bytes, per word) |
 *   row-major float32 matrix of num_words x dimension
 */
class VectorStoreWriter {
public:
    explicit VectorStoreWriter(const std::string& path);
    ~VectorStoreWriter();

    void write_vocabulary(const std::vector<std::string>& words);
    void write_matrix(const std::vector<float>& matrix, uint32_t dimension);
    void finalize();

private:
    std::string path_;
    std::ofstream file_;
    StoreHeader header_;
};

class VectorStoreReader {
public:
    explicit VectorStoreReader(const std::string& path);
    ~VectorStoreReader();

    bool open();
    void close();

    const StoreHeader& header() const { return header_; }

    std::vector<std::string> load_vocabulary();
    std::vector<float> load_matrix();

private:
    std::string path_;
    std::ifstream file_;
    StoreHeader header_;
};

}
