#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "acronym_table.hpp"
#include "url_data.hpp"
#include "url_splitter.hpp"
#include "word_splitter.hpp"

namespace urlfeat {

class UrlTokenizer {
public:
    struct Config {
        size_t min_split_len = DEFAULT_MIN_SPLIT_LEN;
        bool expand_tokens = false;
        bool reverse_path = false;
    };

    // acronyms may be null unless expand_tokens is set
    UrlTokenizer(std::shared_ptr<const WordSplitter> splitter,
                 std::shared_ptr<const AcronymTable> acronyms,
                 const Config& config);
    explicit UrlTokenizer(std::shared_ptr<const WordSplitter> splitter);

    // Decodes, splits and tokenizes a raw URL
    UrlData tokenize(std::string_view url) const;

    // Tokenizes already split parts (expansion and path reversal included)
    UrlData tokenize_parts(const RawUrlParts& parts) const;

    DomainData domains(std::string_view domain) const;
    std::vector<std::string> path(std::string_view path) const;
    std::vector<ArgPair> args(std::string_view args) const;

    std::vector<std::string> split_word(std::string_view text) const;

    const Config& config() const { return config_; }

private:
    std::shared_ptr<const WordSplitter> splitter_;
    std::shared_ptr<const AcronymTable> acronyms_;
    Config config_;
};

}
