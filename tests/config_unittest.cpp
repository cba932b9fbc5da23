#include "config.hpp"

#include "errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace urlfeat {
namespace {

std::string resources_yaml() {
    return "tokenizer:\n"
           "  word_list: " + testing_util::data_path("words.txt") + "\n"
           "  acronyms: " + testing_util::data_path("acronyms.csv") + "\n"
           "embeddings:\n"
           "  sample: " + testing_util::data_path("sample/sample.txt") + "\n";
}

TEST(ConfigTest, DefaultsWhenKeysAreMissing) {
    testing_util::TempFile file(".yaml");
    file.write("server:\n  port: 9000\n");

    AppConfig config = load_config(file.path());
    EXPECT_EQ("sample", config.embedding);
    EXPECT_EQ(5u, config.featurizer.capacities.sub_domain);
    EXPECT_EQ(10u, config.featurizer.capacities.args);
    EXPECT_EQ(Layout::POSITIONAL, config.featurizer.layout);
    EXPECT_EQ(DEFAULT_MIN_SPLIT_LEN, config.featurizer.min_split_len);
    EXPECT_EQ(9000, config.server.port);
    EXPECT_EQ("0.0.0.0", config.server.host);
}

TEST(ConfigTest, ReadsFeaturizerSection) {
    testing_util::TempFile file(".yaml");
    file.write("featurizer:\n"
               "  embedding: FastText\n"
               "  layout: sequential\n"
               "  expand_tokens: true\n"
               "  reverse_path: true\n"
               "  verbose: false\n"
               "  workers: 3\n"
               "  capacities: {sub_domain: 2, main_domain: 3, path: 4, args: 5}\n"
               "tokenizer:\n"
               "  min_split_len: 6\n"
               "features:\n"
               "  untrustworthy_tlds: [TK, ml]\n");

    AppConfig config = load_config(file.path());
    const auto& fc = config.featurizer;
    EXPECT_EQ("FastText", config.embedding);
    EXPECT_EQ(Layout::SEQUENTIAL, fc.layout);
    EXPECT_TRUE(fc.expand_tokens);
    EXPECT_TRUE(fc.reverse_path);
    EXPECT_FALSE(fc.verbose);
    EXPECT_EQ(3u, fc.workers);
    EXPECT_EQ(15u, fc.capacities.total());
    EXPECT_EQ(6u, fc.min_split_len);
    EXPECT_EQ((std::unordered_set<std::string>{"tk", "ml"}), fc.features.untrustworthy_tlds);
}

TEST(ConfigTest, ResolvesRelativePathsAgainstConfigDirectory) {
    testing_util::TempFile file(".yaml");
    file.write("tokenizer:\n"
               "  word_list: words.txt\n"
               "embeddings:\n"
               "  GloVe: vectors/glove.ufv\n"
               "  fasttext: /abs/crawl.vec\n");

    AppConfig config = load_config(file.path());
    const std::filesystem::path dir = std::filesystem::path(file.path()).parent_path();
    EXPECT_EQ((dir / "words.txt").lexically_normal().string(), config.word_list);
    EXPECT_EQ((dir / "vectors/glove.ufv").lexically_normal().string(),
              config.embedding_paths.at("glove"));
    EXPECT_EQ("/abs/crawl.vec", config.embedding_paths.at("fasttext"));
}

TEST(ConfigTest, RejectsNonPositiveCapacity) {
    testing_util::TempFile file(".yaml");
    file.write("featurizer:\n  capacities:\n    path: 0\n");
    EXPECT_THROW(load_config(file.path()), std::invalid_argument);
}

TEST(ConfigTest, RejectsUnknownLayout) {
    testing_util::TempFile file(".yaml");
    file.write("featurizer:\n  layout: diagonal\n");
    EXPECT_THROW(load_config(file.path()), std::invalid_argument);
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_config("/nonexistent/featurizer.yaml"), std::runtime_error);
}

TEST(BuildFeaturizerTest, BuildsSampleFeaturizer) {
    testing_util::TempFile file(".yaml");
    file.write("featurizer:\n"
               "  embedding: sample\n"
               "  verbose: false\n"
               "  capacities: {sub_domain: 1, main_domain: 1, path: 1, args: 1}\n" +
               resources_yaml());

    auto featurizer = build_featurizer(load_config(file.path()));
    ASSERT_NE(nullptr, featurizer);
    EXPECT_EQ(EmbeddingChoice::SAMPLE, featurizer->config().embedding);
    EXPECT_EQ(2u, featurizer->embedding_dim());
    EXPECT_EQ(5u, featurizer->total_length());

    FeaturizedUrl result = featurizer->featurize("http://test.com");
    EXPECT_FALSE(result.placeholder);
    EXPECT_EQ(3.0f, result.features[feature_index(Feature::WORD_COUNT)]);
}

TEST(BuildFeaturizerTest, LoadsAcronymsWhenExpanding) {
    testing_util::TempFile file(".yaml");
    file.write("featurizer:\n"
               "  verbose: false\n"
               "  expand_tokens: true\n" +
               resources_yaml());

    auto featurizer = build_featurizer(load_config(file.path()));
    UrlData data = featurizer->tokenizer().tokenize("http://www.test.com/cs");
    EXPECT_EQ((std::vector<std::string>{"world", "wide", "web"}), data.domains.sub_domains);
    EXPECT_EQ((std::vector<std::string>{"computer", "science"}), data.path);
}

TEST(BuildFeaturizerTest, RejectsUndefinedEmbedding) {
    testing_util::TempFile file(".yaml");
    file.write("featurizer:\n  embedding: undefined-embed\n  verbose: false\n" + resources_yaml());
    EXPECT_THROW(build_featurizer(load_config(file.path())), InvalidEmbeddingChoiceError);
}

TEST(BuildFeaturizerTest, RequiresVectorFileForFamily) {
    testing_util::TempFile file(".yaml");
    file.write("featurizer:\n  embedding: glove\n  verbose: false\n" + resources_yaml());
    EXPECT_THROW(build_featurizer(load_config(file.path())), std::runtime_error);
}

}
}
