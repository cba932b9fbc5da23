#include "feature_extractor.hpp"

#include "lexical.hpp"

#include <algorithm>
#include <cctype>

#include <re2/re2.h>

namespace urlfeat {

namespace {

const RE2& www_weird_pattern() {
    static const RE2 pattern(R"re(^www.+)re");
    return pattern;
}

const RE2& ipv4_pattern() {
    static const RE2 pattern(R"re(\d{1,3}(?:\.\d{1,3}){3})re");
    return pattern;
}

float flag(bool value) {
    return value ? 1.0f : 0.0f;
}

}

const std::array<const char*, FEATURE_COUNT>& feature_names() {
    static const std::array<const char*, FEATURE_COUNT> names = {
        "is_https", "main_domain_words", "sub_domain_count", "is_www",
        "is_www_weird", "path_words", "untrusted_tld", "sub_domain_digits",
        "path_digits", "arg_digits", "total_digits", "has_at_marker",
        "word_count", "domain_length", "path_length", "args_length",
        "path_args_dots", "uppercase_count", "domain_is_ipv4", "suspicious_args",
    };
    return names;
}

FeatureExtractor::FeatureExtractor() : FeatureExtractor(Config{}) {}

FeatureExtractor::FeatureExtractor(const Config& config) : config_(config) {
    std::unordered_set<std::string> lowered;
    for (const auto& tld : config_.untrustworthy_tlds) {
        lowered.insert(to_lower(tld));
    }
    config_.untrustworthy_tlds = std::move(lowered);
}

bool FeatureExtractor::is_untrustworthy(const std::string& tld) const {
    return config_.untrustworthy_tlds.count(tld) > 0;
}

std::vector<float> FeatureExtractor::extract(std::string_view decoded_url,
                                             const RawUrlParts& raw,
                                             const UrlData& data) const {
    const auto& sub_domains = data.domains.sub_domains;
    const auto& path = data.path;
    const std::vector<std::string> arg_tokens = flatten_args(data.args);

    const bool has_at = !path.empty() && path.back() == "@";
    const size_t at_count = has_at ? 1 : 0;

    const size_t sub_digits = count_digits(sub_domains);
    const size_t path_digits = count_digits(path);
    const size_t arg_digits = count_digits(arg_tokens);

    const size_t dots = std::count(raw.path.begin(), raw.path.end(), '.') +
                        std::count(raw.args.begin(), raw.args.end(), '.');
    const size_t uppercase = std::count_if(decoded_url.begin(), decoded_url.end(),
                                           [](unsigned char c) { return std::isupper(c) != 0; });
    const bool suspicious = raw.args.find('\\') != std::string::npos ||
                            raw.args.find(':') != std::string::npos;

    std::vector<float> features(FEATURE_COUNT, 0.0f);
    auto set = [&features](Feature f, float value) { features[feature_index(f)] = value; };

    set(Feature::IS_HTTPS, flag(data.protocol == "https"));
    set(Feature::MAIN_DOMAIN_WORDS, static_cast<float>(data.domains.main_domain.size()));
    set(Feature::SUB_DOMAIN_COUNT, static_cast<float>(sub_domains.size()));
    set(Feature::IS_WWW, flag(!sub_domains.empty() && sub_domains.front() == "www"));
    set(Feature::IS_WWW_WEIRD,
        flag(!sub_domains.empty() && RE2::PartialMatch(sub_domains.front(), www_weird_pattern())));
    set(Feature::PATH_WORDS, static_cast<float>(path.size() - at_count));
    set(Feature::UNTRUSTED_TLD, flag(is_untrustworthy(data.domains.domain_ending)));
    set(Feature::SUB_DOMAIN_DIGITS, static_cast<float>(sub_digits));
    set(Feature::PATH_DIGITS, static_cast<float>(path_digits));
    set(Feature::ARG_DIGITS, static_cast<float>(arg_digits));
    set(Feature::TOTAL_DIGITS, static_cast<float>(sub_digits + path_digits + arg_digits));
    set(Feature::HAS_AT_MARKER, flag(has_at));
    set(Feature::WORD_COUNT, static_cast<float>(flatten_url_data(data).size() - at_count));
    set(Feature::DOMAIN_LENGTH, static_cast<float>(raw.domain.size()));
    set(Feature::PATH_LENGTH, static_cast<float>(raw.path.size()));
    set(Feature::ARGS_LENGTH, static_cast<float>(raw.args.size()));
    set(Feature::PATH_ARGS_DOTS, static_cast<float>(dots));
    set(Feature::UPPERCASE_COUNT, static_cast<float>(uppercase));
    set(Feature::DOMAIN_IS_IPV4, flag(RE2::FullMatch(raw.domain, ipv4_pattern())));
    set(Feature::SUSPICIOUS_ARGS, flag(suspicious));
    return features;
}

}
