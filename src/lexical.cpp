#include "lexical.hpp"

#include <cctype>

namespace urlfeat {

std::string to_lower(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (unsigned char c : str) {
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

std::vector<std::string> split(std::string_view str, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(str.substr(start));
            break;
        }
        parts.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string> split_whitespace(std::string_view str) {
    std::vector<std::string> parts;
    std::string current;
    for (unsigned char c : str) {
        if (std::isspace(c)) {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += static_cast<char>(c);
        }
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

std::string trim(std::string_view str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return std::string(str.substr(begin, end - begin));
}

size_t count_digits(const std::vector<std::string>& tokens) {
    size_t count = 0;
    for (const auto& token : tokens) {
        for (unsigned char c : token) {
            if (std::isdigit(c)) ++count;
        }
    }
    return count;
}

}
