#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace urlfeat {

template <typename T>
std::vector<T> flatten(const std::vector<std::vector<T>>& nested) {
    size_t total = 0;
    for (const auto& inner : nested) {
        total += inner.size();
    }

    std::vector<T> result;
    result.reserve(total);
    for (const auto& inner : nested) {
        result.insert(result.end(), inner.begin(), inner.end());
    }
    return result;
}

template <typename T>
void append(std::vector<T>& dst, const std::vector<T>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

std::string to_lower(std::string_view str);

// Splits on a single character, keeping empty fields
std::vector<std::string> split(std::string_view str, char delim);

// Splits on runs of ASCII whitespace, dropping empty fields
std::vector<std::string> split_whitespace(std::string_view str);

std::string trim(std::string_view str);

size_t count_digits(const std::vector<std::string>& tokens);

}
