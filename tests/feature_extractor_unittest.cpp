#include "feature_extractor.hpp"

#include "url_decoder.hpp"
#include "url_tokenizer.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace urlfeat {
namespace {

class FeatureExtractorTest : public ::testing::Test {
protected:
    std::vector<float> extract(const std::string& url) const {
        return extract_with(extractor_, url);
    }

    std::vector<float> extract_with(const FeatureExtractor& extractor, const std::string& url) const {
        std::string decoded = decode_url(url);
        RawUrlParts raw = split_raw_url(decoded);
        return extractor.extract(decoded, raw, tokenizer_.tokenize_parts(raw));
    }

    static float at(const std::vector<float>& features, Feature f) {
        return features[feature_index(f)];
    }

    UrlTokenizer tokenizer_{testing_util::make_test_splitter()};
    FeatureExtractor extractor_;
};

TEST_F(FeatureExtractorTest, FeatureNamesMatchLength) {
    EXPECT_EQ(FEATURE_COUNT, FeatureExtractor::length());
    EXPECT_STREQ("is_https", feature_names()[feature_index(Feature::IS_HTTPS)]);
    EXPECT_STREQ("suspicious_args", feature_names()[feature_index(Feature::SUSPICIOUS_ARGS)]);
}

TEST_F(FeatureExtractorTest, Protocol) {
    EXPECT_EQ(0.0f, at(extract("http://test.com"), Feature::IS_HTTPS));
    EXPECT_EQ(1.0f, at(extract("https://test.com"), Feature::IS_HTTPS));
}

TEST_F(FeatureExtractorTest, WwwFlags) {
    auto www = extract("http://www.test.com");
    EXPECT_EQ(1.0f, at(www, Feature::IS_WWW));
    EXPECT_EQ(0.0f, at(www, Feature::IS_WWW_WEIRD));

    auto weird = extract("http://www2.test.com");
    EXPECT_EQ(0.0f, at(weird, Feature::IS_WWW));
    EXPECT_EQ(1.0f, at(weird, Feature::IS_WWW_WEIRD));

    auto inner = extract("http://mail.www.test.com");
    EXPECT_EQ(0.0f, at(inner, Feature::IS_WWW));
    EXPECT_EQ(0.0f, at(inner, Feature::IS_WWW_WEIRD));
}

TEST_F(FeatureExtractorTest, UntrustworthyTld) {
    EXPECT_EQ(1.0f, at(extract("http://test.xyz"), Feature::UNTRUSTED_TLD));
    EXPECT_EQ(1.0f, at(extract("http://test.BIZ"), Feature::UNTRUSTED_TLD));
    EXPECT_EQ(0.0f, at(extract("http://test.com"), Feature::UNTRUSTED_TLD));

    FeatureExtractor::Config config;
    config.untrustworthy_tlds = {"COM"};
    FeatureExtractor custom(config);
    EXPECT_TRUE(custom.is_untrustworthy("com"));
    EXPECT_EQ(1.0f, at(extract_with(custom, "http://test.com"), Feature::UNTRUSTED_TLD));
    EXPECT_EQ(0.0f, at(extract_with(custom, "http://test.xyz"), Feature::UNTRUSTED_TLD));
}

TEST_F(FeatureExtractorTest, DigitCounts) {
    auto f = extract("http://part8.site.com/test2024?id=42");
    EXPECT_EQ(1.0f, at(f, Feature::SUB_DOMAIN_DIGITS));
    EXPECT_EQ(4.0f, at(f, Feature::PATH_DIGITS));
    EXPECT_EQ(2.0f, at(f, Feature::ARG_DIGITS));
    EXPECT_EQ(7.0f, at(f, Feature::TOTAL_DIGITS));
}

TEST_F(FeatureExtractorTest, AtMarkerIsNotAPathWord) {
    auto f = extract("http://test.com/some@path");
    EXPECT_EQ(1.0f, at(f, Feature::HAS_AT_MARKER));
    EXPECT_EQ(2.0f, at(f, Feature::PATH_WORDS));
    // http, test, com, some, path
    EXPECT_EQ(5.0f, at(f, Feature::WORD_COUNT));
}

TEST_F(FeatureExtractorTest, RawLengthsAndDots) {
    auto f = extract("http://test.com/path.html?page=a.b");
    EXPECT_EQ(8.0f, at(f, Feature::DOMAIN_LENGTH));
    EXPECT_EQ(10.0f, at(f, Feature::PATH_LENGTH));
    EXPECT_EQ(8.0f, at(f, Feature::ARGS_LENGTH));
    EXPECT_EQ(2.0f, at(f, Feature::PATH_ARGS_DOTS));
}

TEST_F(FeatureExtractorTest, UppercaseCountedOnDecodedUrl) {
    EXPECT_EQ(4.0f, at(extract("http://TEST.com"), Feature::UPPERCASE_COUNT));
    EXPECT_EQ(1.0f, at(extract("http://test.com/%41"), Feature::UPPERCASE_COUNT));
}

TEST_F(FeatureExtractorTest, Ipv4Domain) {
    EXPECT_EQ(1.0f, at(extract("http://192.168.0.1/path"), Feature::DOMAIN_IS_IPV4));
    EXPECT_EQ(0.0f, at(extract("http://192.168.0.test/path"), Feature::DOMAIN_IS_IPV4));
    EXPECT_EQ(0.0f, at(extract("http://1.2.3.4.5/path"), Feature::DOMAIN_IS_IPV4));
}

TEST_F(FeatureExtractorTest, SuspiciousArgs) {
    EXPECT_EQ(1.0f, at(extract("http://test.com/?next=http://x.com"), Feature::SUSPICIOUS_ARGS));
    EXPECT_EQ(1.0f, at(extract("http://test.com/?a%5Cb"), Feature::SUSPICIOUS_ARGS));
    EXPECT_EQ(0.0f, at(extract("http://test.com/?arg=val"), Feature::SUSPICIOUS_ARGS));
}

}
}
