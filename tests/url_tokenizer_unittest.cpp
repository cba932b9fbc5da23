#include "url_tokenizer.hpp"

#include "errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace urlfeat {
namespace {

using Tokens = std::vector<std::string>;

class UrlTokenizerTest : public ::testing::Test {
protected:
    UrlTokenizer tokenizer_{testing_util::make_test_splitter()};
};

TEST_F(UrlTokenizerTest, DomainWithoutSubdomain) {
    DomainData d = tokenizer_.domains("site.com");
    EXPECT_EQ(Tokens{}, d.sub_domains);
    EXPECT_EQ(Tokens{"site"}, d.main_domain);
    EXPECT_EQ("com", d.domain_ending);
}

TEST_F(UrlTokenizerTest, DomainWithWww) {
    DomainData d = tokenizer_.domains("www.site.com");
    EXPECT_EQ(Tokens{"www"}, d.sub_domains);
    EXPECT_EQ(Tokens{"site"}, d.main_domain);
    EXPECT_EQ("com", d.domain_ending);
}

TEST_F(UrlTokenizerTest, ManySubdomains) {
    DomainData d = tokenizer_.domains("rpo.library.part8.site.com");
    EXPECT_EQ((Tokens{"rpo", "library", "part", "8"}), d.sub_domains);
    EXPECT_EQ(Tokens{"site"}, d.main_domain);
    EXPECT_EQ("com", d.domain_ending);
}

TEST_F(UrlTokenizerTest, ManySubdomainsWithSplitMainDomain) {
    DomainData d = tokenizer_.domains("rpo.library.part8.geocities.com");
    EXPECT_EQ((Tokens{"rpo", "library", "part", "8"}), d.sub_domains);
    EXPECT_EQ((Tokens{"geo", "cities"}), d.main_domain);
    EXPECT_EQ("com", d.domain_ending);
}

TEST_F(UrlTokenizerTest, SingleLabelDomainIsMalformed) {
    EXPECT_THROW(tokenizer_.domains("localhost"), MalformedUrlError);
}

TEST_F(UrlTokenizerTest, EmptyPath) {
    EXPECT_EQ(Tokens{}, tokenizer_.path(""));
    EXPECT_EQ(Tokens{}, tokenizer_.path("/"));
}

TEST_F(UrlTokenizerTest, PathSegments) {
    EXPECT_EQ(Tokens{"test"}, tokenizer_.path("/test/"));
    EXPECT_EQ((Tokens{"some", "long", "path", "with", "weird", "2783", "23"}),
              tokenizer_.path("/some/long/path/with/weird/2783/23"));
    EXPECT_EQ((Tokens{"some", "medium", "length", "path"}),
              tokenizer_.path("/some/mediumlengthpath/"));
}

TEST_F(UrlTokenizerTest, PathAtMarker) {
    Tokens tokens = tokenizer_.path("/test@page.html/");
    ASSERT_FALSE(tokens.empty());
    EXPECT_EQ("@", tokens.back());
    EXPECT_EQ((Tokens{"test", "page", "html", "@"}), tokens);

    // One marker however many '@' the path holds
    Tokens twice = tokenizer_.path("/a@b@c");
    EXPECT_EQ(1, std::count(twice.begin(), twice.end(), "@"));
}

TEST_F(UrlTokenizerTest, EmptyArgs) {
    EXPECT_TRUE(tokenizer_.args("").empty());
}

TEST_F(UrlTokenizerTest, SingleArg) {
    std::vector<ArgPair> expected = {{{"sid"}, {"4"}}};
    EXPECT_EQ(expected, tokenizer_.args("sid=4"));
}

TEST_F(UrlTokenizerTest, MultipleArgs) {
    std::vector<ArgPair> expected = {
        {{"sid"}, {"4"}}, {{"ring"}, {"hent"}}, {{"id"}, {"2"}},
    };
    EXPECT_EQ(expected, tokenizer_.args("sid=4&amp;ring=hent&amp;id=2"));
}

TEST_F(UrlTokenizerTest, MultipleArgsWithEmptyValue) {
    std::vector<ArgPair> expected = {
        {{"sid"}, {"4"}}, {{"ring"}, {"hent"}}, {{"id"}, {"2"}}, {{"list"}, {}},
    };
    EXPECT_EQ(expected, tokenizer_.args("sid=4&amp;ring=hent&amp;id=2&amp;list"));
}

TEST_F(UrlTokenizerTest, ArgSeparators) {
    std::vector<ArgPair> expected = {
        {{"a"}, {"1"}}, {{"b"}, {"2"}}, {{"c"}, {"3"}}, {{"d"}, {"4"}},
    };
    EXPECT_EQ(expected, tokenizer_.args("a=1&b=2;c=3\\d=4"));
}

TEST_F(UrlTokenizerTest, MultiwordArgs) {
    std::vector<ArgPair> expected = {
        {{"a", "multi", "word", "param"}, {"multi", "word", "value"}},
    };
    EXPECT_EQ(expected, tokenizer_.args("amultiwordparam=multiwordvalue"));
}

TEST_F(UrlTokenizerTest, ArgKeepsFirstTwoFields) {
    std::vector<ArgPair> expected = {{{"x"}, {"y"}}};
    EXPECT_EQ(expected, tokenizer_.args("x=y=z"));
}

TEST_F(UrlTokenizerTest, FlattenBasicUrl) {
    UrlData data = tokenizer_.tokenize("http://test.com/");
    EXPECT_EQ((Tokens{"http", "test", "com"}), flatten_url_data(data));
}

TEST_F(UrlTokenizerTest, FlattenComprehensiveUrl) {
    UrlData data = tokenizer_.tokenize("http://some.test.com/path.html?arg1=val1");
    EXPECT_EQ((Tokens{"http", "some", "test", "com", "path", "html", "arg1", "val1"}),
              flatten_url_data(data));
}

TEST_F(UrlTokenizerTest, TokenizeDecodesFirst) {
    UrlData data = tokenizer_.tokenize("http://test.com/some%2Fpath?a=1&amp;b=2");
    EXPECT_EQ((Tokens{"some", "path"}), data.path);
    ASSERT_EQ(2u, data.args.size());
    EXPECT_EQ(Tokens{"b"}, data.args[1].param);
}

TEST_F(UrlTokenizerTest, NamedReferencesSplitStructure) {
    UrlData data = tokenizer_.tokenize("http://test.com&sol;page&quest;arg&equals;val");
    EXPECT_EQ("com", data.domains.domain_ending);
    EXPECT_EQ(Tokens{"page"}, data.path);
    ASSERT_EQ(1u, data.args.size());
    EXPECT_EQ(Tokens{"arg"}, data.args[0].param);
    EXPECT_EQ(Tokens{"val"}, data.args[0].value);
}

TEST_F(UrlTokenizerTest, TokenizeRejectsMalformedUrl) {
    EXPECT_THROW(tokenizer_.tokenize("www.test.com"), MalformedUrlError);
}

TEST(UrlTokenizerConfigTest, ReversesPath) {
    UrlTokenizer::Config config;
    config.reverse_path = true;
    UrlTokenizer tokenizer(testing_util::make_test_splitter(), nullptr, config);

    UrlData data = tokenizer.tokenize("http://test.com/some/long/path");
    EXPECT_EQ((Tokens{"path", "long", "some"}), data.path);
}

TEST(UrlTokenizerConfigTest, ExpandsTokens) {
    UrlTokenizer::Config config;
    config.expand_tokens = true;
    auto acronyms = std::make_shared<AcronymTable>(
        std::unordered_map<std::string, std::string>{{"www", "world wide web"},
                                                     {"cs", "computer science"}});
    UrlTokenizer tokenizer(testing_util::make_test_splitter(), acronyms, config);

    UrlData data = tokenizer.tokenize("http://www.test.com/cs/path");
    EXPECT_EQ((Tokens{"world", "wide", "web"}), data.domains.sub_domains);
    EXPECT_EQ((Tokens{"computer", "science", "path"}), data.path);
    EXPECT_EQ("com", data.domains.domain_ending);
}

TEST(UrlTokenizerConfigTest, RequiresCollaborators) {
    EXPECT_THROW(UrlTokenizer(nullptr), std::invalid_argument);

    UrlTokenizer::Config config;
    config.expand_tokens = true;
    EXPECT_THROW(UrlTokenizer(testing_util::make_test_splitter(), nullptr, config),
                 std::invalid_argument);
}

}
}
