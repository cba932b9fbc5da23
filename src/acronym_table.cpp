#include "acronym_table.hpp"

#include "lexical.hpp"

#include <fstream>
#include <stdexcept>

namespace urlfeat {

AcronymTable::AcronymTable(const std::unordered_map<std::string, std::string>& entries) {
    for (const auto& [abbreviation, phrase] : entries) {
        entries_[to_lower(abbreviation)] = phrase;
    }
}

AcronymTable AcronymTable::load_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open acronym table: " + path);
    }

    AcronymTable table;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        size_t comma = stripped.find(',');
        if (comma == std::string::npos) {
            throw std::runtime_error("Invalid acronym line " + std::to_string(line_no) +
                                     " in " + path + ": " + stripped);
        }

        std::string abbreviation = to_lower(trim(stripped.substr(0, comma)));
        std::string phrase = trim(stripped.substr(comma + 1));
        if (abbreviation.empty() || phrase.empty()) continue;

        table.entries_[abbreviation] = phrase;
    }
    return table;
}

std::optional<std::string> AcronymTable::lookup(std::string_view token) const {
    auto it = entries_.find(to_lower(token));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> AcronymTable::expand(const std::string& token) const {
    auto phrase = lookup(token);
    if (!phrase) {
        return {token};
    }
    return split_whitespace(*phrase);
}

}
