#include "word_splitter.hpp"

#include "lexical.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace urlfeat {

namespace {

// Single characters outside the dictionary stay splittable, longer unknown
// substrings never win.
constexpr double UNKNOWN_CHAR_COST = 1e6;

bool is_run_char(unsigned char c) {
    return std::isalnum(c) || c == '\'';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

}

FrequencyWordSplitter::FrequencyWordSplitter(const std::vector<std::string>& words_by_frequency) {
    size_t vocab = std::max<size_t>(words_by_frequency.size(), 2);
    double log_vocab = std::log(static_cast<double>(vocab));

    size_t rank = 0;
    for (const auto& raw : words_by_frequency) {
        std::string word = to_lower(trim(raw));
        if (word.empty()) continue;

        // First occurrence keeps the better rank
        if (word_cost_.find(word) == word_cost_.end()) {
            word_cost_[word] = std::log((rank + 1) * log_vocab);
            max_word_len_ = std::max(max_word_len_, word.size());
        }
        ++rank;
    }
}

FrequencyWordSplitter FrequencyWordSplitter::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open word list: " + path);
    }

    std::vector<std::string> words;
    std::string line;
    while (std::getline(file, line)) {
        std::string word = trim(line);
        if (!word.empty()) {
            words.push_back(std::move(word));
        }
    }

    if (words.empty()) {
        throw std::runtime_error("Word list is empty: " + path);
    }
    return FrequencyWordSplitter(words);
}

double FrequencyWordSplitter::cost_of(const std::string& candidate) const {
    auto it = word_cost_.find(candidate);
    if (it != word_cost_.end()) {
        return it->second;
    }
    if (candidate.size() == 1) {
        return UNKNOWN_CHAR_COST;
    }
    return std::numeric_limits<double>::infinity();
}

std::vector<std::string> FrequencyWordSplitter::segment_run(const std::string& run) const {
    if (run.empty()) return {};

    const std::string lower = to_lower(run);
    const size_t n = run.size();

    // cost[i] is the best cost of the first i characters, best_len[i] the
    // length of the last word of that split. Ties go to the shorter word.
    std::vector<double> cost(n + 1, 0.0);
    std::vector<size_t> best_len(n + 1, 0);

    for (size_t i = 1; i <= n; ++i) {
        double best_cost = std::numeric_limits<double>::infinity();
        size_t best = 1;
        size_t longest = std::min(max_word_len_, i);

        for (size_t len = 1; len <= longest; ++len) {
            double c = cost[i - len] + cost_of(lower.substr(i - len, len));
            if (c < best_cost) {
                best_cost = c;
                best = len;
            }
        }
        cost[i] = best_cost;
        best_len[i] = best;
    }

    std::vector<std::string> out;
    size_t i = n;
    while (i > 0) {
        size_t len = best_len[i];
        std::string token = run.substr(i - len, len);

        bool new_token = true;
        if (token != "'" && !out.empty()) {
            // Re-attach a split "'s" and glue digit runs back together
            if (out.back() == "'s" || (is_digit(run[i - 1]) && is_digit(out.back()[0]))) {
                out.back() = token + out.back();
                new_token = false;
            }
        }
        if (new_token) {
            out.push_back(std::move(token));
        }
        i -= len;
    }

    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<std::string> FrequencyWordSplitter::segment(std::string_view text) const {
    std::vector<std::string> tokens;
    std::string run;

    for (unsigned char c : text) {
        if (is_run_char(c)) {
            run += static_cast<char>(c);
        } else if (!run.empty()) {
            append(tokens, segment_run(run));
            run.clear();
        }
    }
    if (!run.empty()) {
        append(tokens, segment_run(run));
    }
    return tokens;
}

std::vector<std::string> word_split(const WordSplitter& splitter,
                                    std::string_view text,
                                    size_t min_split_len) {
    if (text.empty()) return {};
    if (text.size() <= min_split_len) {
        return {std::string(text)};
    }
    return splitter.segment(text);
}

}
