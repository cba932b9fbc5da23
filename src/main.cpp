#include "config.hpp"
#include "errors.hpp"
#include "lexical.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>

using namespace urlfeat;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <config.yaml> [options]\n\n"
              << "Options:\n"
              << "  --url URL      URL to featurize (repeatable)\n"
              << "  --input FILE   File with one URL per line\n"
              << "  --tokens       Print the tokenized URL instead of features\n"
              << "  --matrix       Also print the embedding matrix\n";
}

void print_tokens(const std::string& name, const std::vector<std::string>& tokens) {
    std::cout << "   " << std::left << std::setw(14) << name << "[";
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << "'" << tokens[i] << "'";
    }
    std::cout << "]\n";
}

void print_url_data(const std::string& url, const UrlData& data) {
    std::cout << url << "\n";
    std::cout << "   " << std::left << std::setw(14) << "protocol" << data.protocol << "\n";
    print_tokens("sub_domains", data.domains.sub_domains);
    print_tokens("main_domain", data.domains.main_domain);
    std::cout << "   " << std::left << std::setw(14) << "domain_ending"
              << data.domains.domain_ending << "\n";
    print_tokens("path", data.path);
    for (const auto& arg : data.args) {
        print_tokens("arg.param", arg.param);
        print_tokens("arg.value", arg.value);
    }
}

void print_featurized(const std::string& url, const FeaturizedUrl& result, bool with_matrix) {
    std::cout << url << (result.placeholder ? "  (placeholder)" : "") << "\n";

    const auto& names = feature_names();
    for (size_t i = 0; i < result.features.size(); ++i) {
        std::cout << "   " << std::left << std::setw(20) << names[i] << result.features[i] << "\n";
    }
    std::cout << "   matrix " << result.matrix.rows << " x " << result.matrix.cols << "\n";

    if (with_matrix) {
        std::cout << std::fixed << std::setprecision(4);
        for (size_t r = 0; r < result.matrix.rows; ++r) {
            std::cout << "   ";
            for (size_t c = 0; c < result.matrix.cols; ++c) {
                std::cout << std::setw(9) << result.matrix.at(r, c);
            }
            std::cout << "\n";
        }
        std::cout.unsetf(std::ios::fixed);
    }
}

std::vector<std::string> read_urls(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open URL file: " + path);
    }

    std::vector<std::string> urls;
    std::string line;
    while (std::getline(file, line)) {
        std::string url = trim(line);
        if (!url.empty()) urls.push_back(std::move(url));
    }
    return urls;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_path;
    std::vector<std::string> urls;
    std::string input_path;
    bool tokens_only = false;
    bool with_matrix = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--url" && i + 1 < argc) {
            urls.push_back(argv[++i]);
        } else if (arg == "--input" && i + 1 < argc) {
            input_path = argv[++i];
        } else if (arg == "--tokens") {
            tokens_only = true;
        } else if (arg == "--matrix") {
            with_matrix = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (config_path.empty() && arg[0] != '-') {
            config_path = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        if (!input_path.empty()) {
            append(urls, read_urls(input_path));
        }
        if (urls.empty()) {
            std::cerr << "No URLs given\n";
            return 1;
        }

        AppConfig config = load_config(config_path);
        auto featurizer = build_featurizer(config);

        if (tokens_only) {
            int failures = 0;
            for (const auto& url : urls) {
                try {
                    print_url_data(url, featurizer->tokenizer().tokenize(url));
                } catch (const MalformedUrlError& e) {
                    std::cerr << e.what() << "\n";
                    ++failures;
                }
            }
            return failures == 0 ? 0 : 2;
        }

        auto results = featurizer->featurize(urls);
        for (size_t i = 0; i < urls.size(); ++i) {
            print_featurized(urls[i], results[i], with_matrix);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
