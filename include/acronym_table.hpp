#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace urlfeat {

/**
 * Abbreviation -> expansion phrase lookup ("cs" -> "computer science").
 * Keys are stored lowercase; lookups lowercase the token first.
 */
class AcronymTable {
public:
    AcronymTable() = default;
    explicit AcronymTable(const std::unordered_map<std::string, std::string>& entries);

    // CSV lines "abbreviation,expansion"; '#' starts a comment line
    static AcronymTable load_csv(const std::string& path);

    std::optional<std::string> lookup(std::string_view token) const;

    // Expansion split on whitespace, or the token itself on a miss
    std::vector<std::string> expand(const std::string& token) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::unordered_map<std::string, std::string> entries_;
};

}
