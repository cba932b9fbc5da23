#include "web_server.hpp"

#include "errors.hpp"
#include "lexical.hpp"

#include "httplib.h"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace urlfeat {

namespace {

void write_string_array(std::ostringstream& json, const std::vector<std::string>& tokens,
                        std::string (*escape)(const std::string&)) {
    json << "[";
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) json << ",";
        json << "\"" << escape(tokens[i]) << "\"";
    }
    json << "]";
}

void write_float_array(std::ostringstream& json, const float* values, size_t count) {
    json << "[";
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) json << ",";
        json << values[i];
    }
    json << "]";
}

}

WebServer::WebServer(const Config& config, std::unique_ptr<UrlFeaturizer> featurizer)
    : config_(config), featurizer_(std::move(featurizer)) {
    if (!featurizer_) {
        throw std::invalid_argument("WebServer requires a featurizer");
    }
}

WebServer::~WebServer() = default;

std::string WebServer::html_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '&': result += "&amp;"; break;
            case '"': result += "&quot;"; break;
            default: result += c;
        }
    }
    return result;
}

std::string WebServer::json_escape(const std::string& s) {
    std::ostringstream out;
    for (unsigned char c : s) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (c < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

std::string WebServer::tokenize_json(const std::string& url) const {
    UrlData data = featurizer_->tokenizer().tokenize(url);

    std::ostringstream json;
    json << "{\"url\":\"" << json_escape(url) << "\","
         << "\"protocol\":\"" << json_escape(data.protocol) << "\","
         << "\"sub_domains\":";
    write_string_array(json, data.domains.sub_domains, json_escape);
    json << ",\"main_domain\":";
    write_string_array(json, data.domains.main_domain, json_escape);
    json << ",\"domain_ending\":\"" << json_escape(data.domains.domain_ending) << "\","
         << "\"path\":";
    write_string_array(json, data.path, json_escape);
    json << ",\"args\":[";
    for (size_t i = 0; i < data.args.size(); ++i) {
        if (i > 0) json << ",";
        json << "{\"param\":";
        write_string_array(json, data.args[i].param, json_escape);
        json << ",\"value\":";
        write_string_array(json, data.args[i].value, json_escape);
        json << "}";
    }
    json << "]}";
    return json.str();
}

std::string WebServer::featurize_json(const std::vector<std::string>& urls, bool with_matrix) const {
    auto results = featurizer_->featurize(urls);

    std::ostringstream json;
    json << "{\"feature_names\":[";
    const auto& names = feature_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) json << ",";
        json << "\"" << names[i] << "\"";
    }
    json << "],\"results\":[";

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        if (i > 0) json << ",";
        json << "{\"url\":\"" << json_escape(urls[i]) << "\","
             << "\"placeholder\":" << (r.placeholder ? "true" : "false") << ","
             << "\"features\":";
        write_float_array(json, r.features.data(), r.features.size());
        json << ",\"shape\":[" << r.matrix.rows << "," << r.matrix.cols << "]";
        if (with_matrix) {
            json << ",\"matrix\":[";
            for (size_t row = 0; row < r.matrix.rows; ++row) {
                if (row > 0) json << ",";
                write_float_array(json, r.matrix.row(row), r.matrix.cols);
            }
            json << "]";
        }
        json << "}";
    }
    json << "]}";
    return json.str();
}

std::string WebServer::render_index_page() const {
    return R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<title>URL Featurizer</title>
<style>
*{box-sizing:border-box;margin:0;padding:0}
body{font-family:sans-serif;background:#f5f5f5;min-height:100vh;display:flex;align-items:center;justify-content:center}
.container{text-align:center;padding:20px}
h1{font-size:2.5rem;margin-bottom:30px}
.form{display:flex;max-width:700px;margin:0 auto}
input[type="text"]{flex:1;padding:15px 20px;font-size:18px;border:2px solid #ddd;border-radius:25px 0 0 25px;outline:none}
button{padding:15px 30px;font-size:18px;background:#4a90d9;color:white;border:none;border-radius:0 25px 25px 0;cursor:pointer}
</style>
</head>
<body>
<div class="container">
<h1>URL Featurizer</h1>
<form action="/featurize" method="get" class="form">
<input type="text" name="url" placeholder="http://www.example.com/path?arg=val" autofocus>
<button type="submit">Featurize</button>
</form>
</div>
</body>
</html>)";
}

std::string WebServer::render_result_page(const std::string& url) const {
    FeaturizedUrl result = featurizer_->featurize(url);

    std::ostringstream html;
    html << R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<title>)" << html_escape(url) << R"( - URL Featurizer</title>
<style>
body{font-family:sans-serif;background:#f5f5f5;line-height:1.6}
.container{max-width:900px;margin:0 auto;padding:20px}
table{border-collapse:collapse;background:white}
td,th{border:1px solid #ddd;padding:4px 12px;text-align:left}
.error{color:#b00}
</style>
</head>
<body>
<div class="container">
<h1><a href="/">URL Featurizer</a></h1>
<p><cite>)" << html_escape(url) << "</cite></p>\n";

    if (result.placeholder) {
        html << "<p class=\"error\">URL could not be tokenized, features are zero.</p>\n";
    } else {
        UrlData data = featurizer_->tokenizer().tokenize(url);
        html << "<p>Tokens:";
        for (const auto& token : flatten_url_data(data)) {
            html << " <code>" << html_escape(token) << "</code>";
        }
        html << "</p>\n";
    }

    html << "<table>\n<tr><th>feature</th><th>value</th></tr>\n";
    const auto& names = feature_names();
    for (size_t i = 0; i < result.features.size(); ++i) {
        html << "<tr><td>" << names[i] << "</td><td>" << result.features[i] << "</td></tr>\n";
    }
    html << "</table>\n<p>Embedding matrix: " << result.matrix.rows << " x "
         << result.matrix.cols << "</p>\n</div>\n</body>\n</html>";
    return html.str();
}

void WebServer::run() {
    std::cout << "Starting web server on http://" << config_.host
              << ":" << config_.port << "\n";
    std::cout << "Embedding: " << to_string(featurizer_->config().embedding) << ", "
              << featurizer_->embeddings().size() << " vectors of dimension "
              << featurizer_->embedding_dim() << "\n";

    httplib::Server server;

    server.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(render_index_page(), "text/html; charset=utf-8");
    });

    server.Get("/featurize", [this](const httplib::Request& req, httplib::Response& res) {
        std::string url = req.has_param("url") ? req.get_param_value("url") : "";
        if (url.empty()) {
            res.set_redirect("/");
            return;
        }
        res.set_content(render_result_page(url), "text/html; charset=utf-8");
    });

    server.Get("/api/tokenize", [this](const httplib::Request& req, httplib::Response& res) {
        std::string url = req.has_param("url") ? req.get_param_value("url") : "";
        try {
            res.set_content(tokenize_json(url), "application/json; charset=utf-8");
        } catch (const MalformedUrlError& e) {
            res.status = 400;
            res.set_content("{\"error\":\"" + json_escape(e.what()) + "\"}",
                            "application/json; charset=utf-8");
        }
    });

    server.Get("/api/featurize", [this](const httplib::Request& req, httplib::Response& res) {
        std::vector<std::string> urls;
        if (req.has_param("url")) {
            urls.push_back(req.get_param_value("url"));
        }
        bool with_matrix = req.has_param("matrix") && req.get_param_value("matrix") == "1";
        res.set_content(featurize_json(urls, with_matrix), "application/json; charset=utf-8");
    });

    server.Post("/api/featurize", [this](const httplib::Request& req, httplib::Response& res) {
        std::vector<std::string> urls;
        for (const auto& line : split(req.body, '\n')) {
            std::string url = trim(line);
            if (!url.empty()) urls.push_back(std::move(url));
        }
        bool with_matrix = req.has_param("matrix") && req.get_param_value("matrix") == "1";
        res.set_content(featurize_json(urls, with_matrix), "application/json; charset=utf-8");
    });

    if (!server.listen(config_.host.c_str(), config_.port)) {
        throw std::runtime_error("Cannot listen on " + config_.host + ":" +
                                 std::to_string(config_.port));
    }
}

}
