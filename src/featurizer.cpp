#include "featurizer.hpp"

#include "thread_slices.hpp"
#include "url_decoder.hpp"
#include "url_splitter.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace urlfeat {

namespace {

UrlTokenizer::Config tokenizer_config(const UrlFeaturizer::Config& config) {
    UrlTokenizer::Config tok_config;
    tok_config.min_split_len = config.min_split_len;
    tok_config.expand_tokens = config.expand_tokens;
    tok_config.reverse_path = config.reverse_path;
    return tok_config;
}

}

UrlFeaturizer::UrlFeaturizer(const Config& config, Resources resources)
    : config_(config),
      resources_(std::move(resources)),
      tokenizer_(resources_.splitter, resources_.acronyms, tokenizer_config(config_)),
      extractor_(config_.features),
      builder_(resources_.embeddings, embedding_family(config_.embedding).prefix) {
    config_.capacities.validate();
    if (config_.workers == 0) {
        config_.workers = 1;
    }

    if (config_.verbose) {
        spdlog::info("UrlFeaturizer ready: embedding={} dim={} vocab={} N={} layout={}",
                     to_string(config_.embedding), embedding_dim(), builder_.index().size(),
                     total_length(), to_string(config_.layout));
    }
}

FeaturizedUrl UrlFeaturizer::featurize_or_throw(const std::string& url) const {
    const std::string decoded = decode_url(url);
    const RawUrlParts raw = split_raw_url(decoded);
    const UrlData data = tokenizer_.tokenize_parts(raw);

    spdlog::debug("Tokenized {}: {} sub-domain, {} main-domain, {} path, {} arg tokens",
                  url, data.domains.sub_domains.size(), data.domains.main_domain.size(),
                  data.path.size(), data.args.size());

    FeaturizedUrl result;
    result.features = extractor_.extract(decoded, raw, data);
    result.matrix = builder_.build(data, config_.capacities, config_.layout);
    return result;
}

FeaturizedUrl UrlFeaturizer::placeholder() const {
    FeaturizedUrl result;
    result.features.assign(feature_length(), 0.0f);
    result.matrix = Matrix(total_length(), embedding_dim());
    result.placeholder = true;
    return result;
}

FeaturizedUrl UrlFeaturizer::featurize(const std::string& url) const {
    try {
        return featurize_or_throw(url);
    } catch (const std::exception& e) {
        spdlog::warn("Error with \"{}\": {}", url, e.what());
        return placeholder();
    }
}

std::vector<FeaturizedUrl> UrlFeaturizer::featurize(const std::vector<std::string>& urls) const {
    std::vector<FeaturizedUrl> results(urls.size());

    // Each worker owns a contiguous slice of the output
    run_in_slices(urls.size(), config_.workers, [this, &urls, &results](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            results[i] = featurize(urls[i]);
        }
    });
    return results;
}

void UrlFeaturizer::set_hyperparams(std::optional<size_t> sub_domain,
                                    std::optional<size_t> main_domain,
                                    std::optional<size_t> path,
                                    std::optional<size_t> args) {
    ZoneCapacities updated = config_.capacities;
    if (sub_domain) updated.sub_domain = *sub_domain;
    if (main_domain) updated.main_domain = *main_domain;
    if (path) updated.path = *path;
    if (args) updated.args = *args;

    updated.validate();
    config_.capacities = updated;

    if (config_.verbose) {
        spdlog::info("Capacities set to sub_domain={} main_domain={} path={} args={} (N={})",
                     updated.sub_domain, updated.main_domain, updated.path, updated.args,
                     total_length());
    }
}

}
