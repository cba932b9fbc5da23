#pragma once

#include <map>
#include <memory>
#include <string>

#include "featurizer.hpp"

namespace urlfeat {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
};

struct AppConfig {
    std::string embedding = "sample";
    UrlFeaturizer::Config featurizer;
    std::string word_list = "data/words.txt";
    std::string acronyms = "data/acronyms.csv";
    std::map<std::string, std::string> embedding_paths;   // lowercase family name -> file
    ServerConfig server;
};

/**
 * Reads a YAML config file. Missing keys keep their defaults; relative
 * resource paths are resolved against the directory of the config file.
 */
AppConfig load_config(const std::string& config_path);

/**
 * Loads the resources named by config and builds a featurizer.
 * @throws InvalidEmbeddingChoiceError for an unknown embedding name
 * @throws std::runtime_error when a resource file cannot be loaded
 */
std::unique_ptr<UrlFeaturizer> build_featurizer(const AppConfig& config);

}
