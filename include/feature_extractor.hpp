#pragma once

#include <array>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "url_data.hpp"
#include "url_splitter.hpp"

namespace urlfeat {

// Positions in the hand-picked feature vector
enum class Feature : size_t {
    IS_HTTPS = 0,
    MAIN_DOMAIN_WORDS,
    SUB_DOMAIN_COUNT,
    IS_WWW,
    IS_WWW_WEIRD,
    PATH_WORDS,
    UNTRUSTED_TLD,
    SUB_DOMAIN_DIGITS,
    PATH_DIGITS,
    ARG_DIGITS,
    TOTAL_DIGITS,
    HAS_AT_MARKER,
    WORD_COUNT,
    DOMAIN_LENGTH,
    PATH_LENGTH,
    ARGS_LENGTH,
    PATH_ARGS_DOTS,
    UPPERCASE_COUNT,
    DOMAIN_IS_IPV4,
    SUSPICIOUS_ARGS,
};

constexpr size_t FEATURE_COUNT = 20;

const std::array<const char*, FEATURE_COUNT>& feature_names();

inline size_t feature_index(Feature f) { return static_cast<size_t>(f); }

class FeatureExtractor {
public:
    struct Config {
        std::unordered_set<std::string> untrustworthy_tlds = {"xyz", "biz", "info"};
    };

    FeatureExtractor();
    explicit FeatureExtractor(const Config& config);

    /**
     * Computes the hand-picked features of one URL.
     * @param decoded_url Percent/HTML decoded URL, original letter case
     * @param raw Splitter output for decoded_url
     * @param data Tokenized (and possibly expanded) URL
     */
    std::vector<float> extract(std::string_view decoded_url,
                               const RawUrlParts& raw,
                               const UrlData& data) const;

    bool is_untrustworthy(const std::string& tld) const;

    static constexpr size_t length() { return FEATURE_COUNT; }

private:
    Config config_;
};

}
