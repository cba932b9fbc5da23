#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "acronym_table.hpp"
#include "embedding_catalog.hpp"
#include "embedding_index.hpp"
#include "embedding_matrix.hpp"
#include "feature_extractor.hpp"
#include "url_tokenizer.hpp"
#include "word_splitter.hpp"

namespace urlfeat {

struct FeaturizedUrl {
    std::vector<float> features;
    Matrix matrix;
    bool placeholder = false;   // URL failed and was replaced by zeros
};

class UrlFeaturizer {
public:
    struct Config {
        EmbeddingChoice embedding = EmbeddingChoice::SAMPLE;
        ZoneCapacities capacities;
        Layout layout = Layout::POSITIONAL;
        bool expand_tokens = false;
        bool reverse_path = false;
        bool verbose = true;
        size_t min_split_len = DEFAULT_MIN_SPLIT_LEN;
        size_t workers = 1;
        FeatureExtractor::Config features;
    };

    struct Resources {
        std::shared_ptr<const EmbeddingIndex> embeddings;
        std::shared_ptr<const WordSplitter> splitter;
        std::shared_ptr<const AcronymTable> acronyms;   // required when expand_tokens
    };

    UrlFeaturizer(const Config& config, Resources resources);

    // Never throws for a bad URL: failures become zero placeholders
    FeaturizedUrl featurize(const std::string& url) const;

    // One result per input, in input order
    std::vector<FeaturizedUrl> featurize(const std::vector<std::string>& urls) const;

    // Changes only the given capacities; not safe during concurrent featurize calls
    void set_hyperparams(std::optional<size_t> sub_domain = std::nullopt,
                         std::optional<size_t> main_domain = std::nullopt,
                         std::optional<size_t> path = std::nullopt,
                         std::optional<size_t> args = std::nullopt);

    size_t total_length() const { return config_.capacities.total(); }
    size_t embedding_dim() const { return builder_.dimension(); }
    size_t feature_length() const { return FeatureExtractor::length(); }

    const Config& config() const { return config_; }
    const UrlTokenizer& tokenizer() const { return tokenizer_; }
    const EmbeddingIndex& embeddings() const { return builder_.index(); }

private:
    Config config_;
    Resources resources_;
    UrlTokenizer tokenizer_;
    FeatureExtractor extractor_;
    EmbeddingMatrixBuilder builder_;

    FeaturizedUrl featurize_or_throw(const std::string& url) const;
    FeaturizedUrl placeholder() const;
};

}
