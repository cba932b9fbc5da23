#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace urlfeat {

constexpr size_t DEFAULT_MIN_SPLIT_LEN = 4;

/**
 * Sub-word segmentation strategy.
 * segment() must return tokens whose concatenation reproduces the
 * alphanumeric and apostrophe characters of the input, in order.
 */
class WordSplitter {
public:
    virtual ~WordSplitter() = default;

    virtual std::vector<std::string> segment(std::string_view text) const = 0;
};

/**
 * Most-probable segmentation over a word list ordered by frequency.
 * A word at rank r costs log((r + 1) * log(vocabulary_size)); the split
 * with the lowest total cost wins. Characters outside [a-zA-Z0-9'] separate
 * independent runs and are dropped. Adjacent digits stay in one token.
 */
class FrequencyWordSplitter : public WordSplitter {
public:
    explicit FrequencyWordSplitter(const std::vector<std::string>& words_by_frequency);

    // One word per line, most frequent first
    static FrequencyWordSplitter from_file(const std::string& path);

    std::vector<std::string> segment(std::string_view text) const override;

    size_t vocabulary_size() const { return word_cost_.size(); }
    size_t max_word_length() const { return max_word_len_; }

private:
    std::unordered_map<std::string, double> word_cost_;
    size_t max_word_len_ = 1;

    double cost_of(const std::string& candidate) const;
    std::vector<std::string> segment_run(const std::string& run) const;
};

/**
 * Word-splits a single raw token.
 * Empty text yields no tokens; text no longer than min_split_len is
 * returned unchanged as the only token.
 */
std::vector<std::string> word_split(const WordSplitter& splitter,
                                    std::string_view text,
                                    size_t min_split_len = DEFAULT_MIN_SPLIT_LEN);

}
