#include "vector_store.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string output_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " <vectors.txt> <vectors.ufv>\n\n"
                      << "Converts a word2vec / GloVe / fastText text file into the\n"
                      << "binary vector store read by url_featurize.\n";
            return 0;
        } else if (input_path.empty()) {
            input_path = arg;
        } else if (output_path.empty()) {
            output_path = arg;
        }
    }

    if (input_path.empty() || output_path.empty()) {
        std::cerr << "Usage: " << argv[0] << " <vectors.txt> <vectors.ufv>\n";
        return 1;
    }

    try {
        auto start = std::chrono::steady_clock::now();

        auto store = urlfeat::VectorStore::load_text(input_path, urlfeat::FallbackMode::MEAN);
        std::cout << "Read " << store->size() << " vectors of dimension "
                  << store->dimension() << " from " << input_path << "\n";

        store->save(output_path);

        double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
        std::cout << "Wrote " << output_path << " in " << std::fixed
                  << std::setprecision(2) << elapsed << " s\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
