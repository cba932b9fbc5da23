#include "config.hpp"

#include "lexical.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace urlfeat {

namespace {

size_t positive(const YAML::Node& node, size_t default_value, const std::string& key) {
    if (!node) return default_value;
    long long value = node.as<long long>();
    if (value <= 0) {
        throw std::invalid_argument(key + " must be a positive integer");
    }
    return static_cast<size_t>(value);
}

std::string resolve(const std::filesystem::path& base, const std::string& path) {
    if (path.empty()) return path;
    std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    return (base / p).lexically_normal().string();
}

}

AppConfig load_config(const std::string& config_path) {
    AppConfig config;

    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot load config " + config_path + ": " + e.what());
    }

    const std::filesystem::path base = std::filesystem::path(config_path).parent_path();

    if (auto f = yaml["featurizer"]) {
        auto& fc = config.featurizer;
        config.embedding = f["embedding"].as<std::string>(config.embedding);
        fc.expand_tokens = f["expand_tokens"].as<bool>(fc.expand_tokens);
        fc.reverse_path = f["reverse_path"].as<bool>(fc.reverse_path);
        fc.verbose = f["verbose"].as<bool>(fc.verbose);
        fc.workers = positive(f["workers"], fc.workers, "featurizer.workers");
        if (f["layout"]) {
            fc.layout = parse_layout(f["layout"].as<std::string>());
        }

        if (auto caps = f["capacities"]) {
            fc.capacities.sub_domain = positive(caps["sub_domain"], fc.capacities.sub_domain,
                                                "capacities.sub_domain");
            fc.capacities.main_domain = positive(caps["main_domain"], fc.capacities.main_domain,
                                                 "capacities.main_domain");
            fc.capacities.path = positive(caps["path"], fc.capacities.path, "capacities.path");
            fc.capacities.args = positive(caps["args"], fc.capacities.args, "capacities.args");
        }
    }

    if (auto t = yaml["tokenizer"]) {
        config.featurizer.min_split_len =
            positive(t["min_split_len"], config.featurizer.min_split_len, "tokenizer.min_split_len");
        config.word_list = t["word_list"].as<std::string>(config.word_list);
        config.acronyms = t["acronyms"].as<std::string>(config.acronyms);
    }

    if (auto feats = yaml["features"]) {
        if (auto tlds = feats["untrustworthy_tlds"]) {
            config.featurizer.features.untrustworthy_tlds.clear();
            for (const auto& tld : tlds) {
                config.featurizer.features.untrustworthy_tlds.insert(to_lower(tld.as<std::string>()));
            }
        }
    }

    if (auto emb = yaml["embeddings"]) {
        for (const auto& entry : emb) {
            config.embedding_paths[to_lower(entry.first.as<std::string>())] =
                resolve(base, entry.second.as<std::string>());
        }
    }

    if (auto s = yaml["server"]) {
        config.server.host = s["host"].as<std::string>(config.server.host);
        config.server.port = s["port"].as<int>(config.server.port);
    }

    config.word_list = resolve(base, config.word_list);
    config.acronyms = resolve(base, config.acronyms);
    return config;
}

std::unique_ptr<UrlFeaturizer> build_featurizer(const AppConfig& config) {
    auto start = std::chrono::steady_clock::now();

    UrlFeaturizer::Config fc = config.featurizer;
    fc.embedding = parse_embedding_choice(config.embedding);

    const std::string family = to_lower(to_string(fc.embedding));
    auto path_it = config.embedding_paths.find(family);
    if (path_it == config.embedding_paths.end()) {
        throw std::runtime_error("No vector file configured for embedding " + to_string(fc.embedding));
    }

    UrlFeaturizer::Resources resources;

    if (fc.verbose) spdlog::info("Reading word list {}", config.word_list);
    resources.splitter = std::make_shared<FrequencyWordSplitter>(
        FrequencyWordSplitter::from_file(config.word_list));

    if (fc.expand_tokens) {
        if (fc.verbose) spdlog::info("Reading acronym table {}", config.acronyms);
        resources.acronyms = std::make_shared<AcronymTable>(AcronymTable::load_csv(config.acronyms));
    }

    if (fc.verbose) spdlog::info("Reading the {} word vector file {}", to_string(fc.embedding), path_it->second);
    resources.embeddings = load_embedding(fc.embedding, path_it->second);

    auto featurizer = std::make_unique<UrlFeaturizer>(fc, std::move(resources));

    if (fc.verbose) {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        spdlog::info("Created {} UrlFeaturizer in {:.1f} s", to_string(fc.embedding), elapsed);
    }
    return featurizer;
}

}
