#pragma once

#include <memory>
#include <string>
#include <vector>

#include "featurizer.hpp"

namespace urlfeat {

class WebServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8080;
    };

    WebServer(const Config& config, std::unique_ptr<UrlFeaturizer> featurizer);
    ~WebServer();

    void run();

    // JSON bodies of the API endpoints
    std::string tokenize_json(const std::string& url) const;
    std::string featurize_json(const std::vector<std::string>& urls, bool with_matrix) const;

private:
    Config config_;
    std::unique_ptr<UrlFeaturizer> featurizer_;

    std::string render_index_page() const;
    std::string render_result_page(const std::string& url) const;

    static std::string html_escape(const std::string& s);
    static std::string json_escape(const std::string& s);
};

}
