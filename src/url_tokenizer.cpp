#include "url_tokenizer.hpp"

#include "errors.hpp"
#include "lexical.hpp"
#include "token_expander.hpp"
#include "url_decoder.hpp"

#include <algorithm>
#include <stdexcept>

namespace urlfeat {

namespace {

constexpr std::string_view ENCODED_AMP = "&amp;";

// Splits on "&amp;", ';', '&' and '\', trying "&amp;" first at each position
std::vector<std::string> split_arg_chunks(std::string_view args) {
    std::vector<std::string> chunks;
    std::string current;

    size_t i = 0;
    while (i < args.size()) {
        if (args.compare(i, ENCODED_AMP.size(), ENCODED_AMP) == 0) {
            chunks.push_back(std::move(current));
            current.clear();
            i += ENCODED_AMP.size();
            continue;
        }

        char c = args[i];
        if (c == ';' || c == '&' || c == '\\') {
            chunks.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
        ++i;
    }
    chunks.push_back(std::move(current));
    return chunks;
}

}

UrlTokenizer::UrlTokenizer(std::shared_ptr<const WordSplitter> splitter,
                           std::shared_ptr<const AcronymTable> acronyms,
                           const Config& config)
    : splitter_(std::move(splitter)), acronyms_(std::move(acronyms)), config_(config) {
    if (!splitter_) {
        throw std::invalid_argument("UrlTokenizer requires a word splitter");
    }
    if (config_.expand_tokens && !acronyms_) {
        throw std::invalid_argument("Token expansion requires an acronym table");
    }
}

UrlTokenizer::UrlTokenizer(std::shared_ptr<const WordSplitter> splitter)
    : UrlTokenizer(std::move(splitter), nullptr, Config{}) {}

std::vector<std::string> UrlTokenizer::split_word(std::string_view text) const {
    return word_split(*splitter_, text, config_.min_split_len);
}

UrlData UrlTokenizer::tokenize(std::string_view url) const {
    return tokenize_parts(split_raw_url(decode_url(url)));
}

UrlData UrlTokenizer::tokenize_parts(const RawUrlParts& parts) const {
    UrlData data;
    data.protocol = parts.protocol;
    data.domains = domains(parts.domain);
    data.path = path(parts.path);
    data.args = args(parts.args);

    if (config_.reverse_path) {
        std::reverse(data.path.begin(), data.path.end());
    }

    if (config_.expand_tokens) {
        return expand_url_data(data, *acronyms_);
    }
    return data;
}

DomainData UrlTokenizer::domains(std::string_view domain) const {
    std::vector<std::string> labels = split(domain, '.');
    if (labels.size() < 2) {
        throw MalformedUrlError(std::string(domain));
    }

    DomainData result;
    result.domain_ending = labels.back();
    result.main_domain = split_word(labels[labels.size() - 2]);
    for (size_t i = 0; i + 2 < labels.size(); ++i) {
        append(result.sub_domains, split_word(labels[i]));
    }
    return result;
}

std::vector<std::string> UrlTokenizer::path(std::string_view path) const {
    std::vector<std::string> tokens;
    for (const auto& segment : split(path, '/')) {
        if (!segment.empty()) {
            append(tokens, split_word(segment));
        }
    }
    if (path.find('@') != std::string_view::npos) {
        tokens.emplace_back("@");
    }
    return tokens;
}

std::vector<ArgPair> UrlTokenizer::args(std::string_view args) const {
    if (args.empty()) return {};

    std::vector<ArgPair> pairs;
    for (const auto& chunk : split_arg_chunks(args)) {
        // Only the first two '='-separated fields are kept
        std::vector<std::string> fields = split(chunk, '=');
        const std::string& param = fields[0];
        const std::string value = fields.size() > 1 ? fields[1] : std::string();

        pairs.push_back({split_word(param), split_word(value)});
    }
    return pairs;
}

}
