#include "url_decoder.hpp"

#include <cctype>
#include <cstdint>
#include <unordered_map>

namespace urlfeat {

namespace {

struct EntityRecord {
    const char* name;
    bool terminated;
    uint32_t first;
    uint32_t second;
};

const EntityRecord ENTITY_RECORDS[] = {
#include "html_entities.inc"
};

// Windows-1252 meaning of the C1 control range in numeric references.
// The five code points cp1252 leaves undefined map to themselves.
const std::unordered_map<uint32_t, uint32_t>& cp1252_overrides() {
    static const std::unordered_map<uint32_t, uint32_t> table = {
        {0x80, 0x20AC}, {0x81, 0x0081}, {0x82, 0x201A}, {0x83, 0x0192},
        {0x84, 0x201E}, {0x85, 0x2026}, {0x86, 0x2020}, {0x87, 0x2021},
        {0x88, 0x02C6}, {0x89, 0x2030}, {0x8A, 0x0160}, {0x8B, 0x2039},
        {0x8C, 0x0152}, {0x8D, 0x008D}, {0x8E, 0x017D}, {0x8F, 0x008F},
        {0x90, 0x0090}, {0x91, 0x2018}, {0x92, 0x2019}, {0x93, 0x201C},
        {0x94, 0x201D}, {0x95, 0x2022}, {0x96, 0x2013}, {0x97, 0x2014},
        {0x98, 0x02DC}, {0x99, 0x2122}, {0x9A, 0x0161}, {0x9B, 0x203A},
        {0x9C, 0x0153}, {0x9D, 0x009D}, {0x9E, 0x017E}, {0x9F, 0x0178},
    };
    return table;
}

constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;
constexpr uint32_t MAX_CODEPOINT = 0x10FFFF;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Keys carry the trailing ';' when the reference requires it
const std::unordered_map<std::string, std::string>& named_entities() {
    static const std::unordered_map<std::string, std::string> entities = [] {
        std::unordered_map<std::string, std::string> table;
        table.reserve(sizeof(ENTITY_RECORDS) / sizeof(ENTITY_RECORDS[0]));
        for (const auto& record : ENTITY_RECORDS) {
            std::string key = record.name;
            if (record.terminated) key += ';';

            std::string value;
            append_utf8(value, record.first);
            if (record.second != 0) append_utf8(value, record.second);
            table.emplace(std::move(key), std::move(value));
        }
        return table;
    }();
    return entities;
}

bool is_dropped_codepoint(uint32_t cp) {
    if ((cp >= 0x01 && cp <= 0x08) || cp == 0x0B) return true;
    if (cp >= 0x0E && cp <= 0x1F) return true;
    if (cp >= 0x7F && cp <= 0x9F) return true;
    if (cp >= 0xFDD0 && cp <= 0xFDEF) return true;
    return (cp & 0xFFFE) == 0xFFFE;
}

void append_codepoint(std::string& out, uint32_t cp) {
    auto it = cp1252_overrides().find(cp);
    if (it != cp1252_overrides().end()) {
        append_utf8(out, it->second);
        return;
    }
    if (cp == 0x00 || (cp >= 0xD800 && cp <= 0xDFFF) || cp > MAX_CODEPOINT) {
        append_utf8(out, REPLACEMENT_CHAR);
        return;
    }
    if (cp == 0x0D) {
        out += '\r';
        return;
    }
    if (is_dropped_codepoint(cp)) {
        return;
    }
    append_utf8(out, cp);
}

// Length of the well-formed UTF-8 sequence at pos, or the length of its
// maximal invalid prefix (at least 1) with valid set to false
size_t utf8_sequence(std::string_view str, size_t pos, bool& valid) {
    const auto byte = [&str](size_t i) { return static_cast<unsigned char>(str[i]); };
    const unsigned char lead = byte(pos);

    valid = true;
    if (lead < 0x80) return 1;

    size_t length = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        valid = false;
        return 1;
    }

    for (size_t k = 1; k < length; ++k) {
        if (pos + k >= str.size()) {
            valid = false;
            return k;
        }
        const unsigned char c = byte(pos + k);
        if (c < lo || c > hi) {
            valid = false;
            return k;
        }
        lo = 0x80;
        hi = 0xBF;
    }
    return length;
}

// Replaces every maximal invalid UTF-8 subsequence with U+FFFD
std::string replace_invalid_utf8(std::string_view bytes) {
    std::string result;
    result.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        bool valid = true;
        size_t length = utf8_sequence(bytes, i, valid);
        if (valid) {
            result.append(bytes.substr(i, length));
        } else {
            append_utf8(result, REPLACEMENT_CHAR);
        }
        i += length;
    }
    return result;
}

bool is_name_char(char c) {
    return c != '\t' && c != '\n' && c != '\f' && c != ' ' &&
           c != '<' && c != '&' && c != '#' && c != ';';
}

// Decodes the reference starting right after '&'. Returns the number of
// consumed characters, or 0 when nothing matched.
size_t decode_reference(std::string_view str, size_t pos, std::string& out) {
    if (pos >= str.size()) return 0;

    if (str[pos] == '#') {
        size_t i = pos + 1;
        bool hex = i < str.size() && (str[i] == 'x' || str[i] == 'X');
        if (hex) ++i;

        size_t digits_begin = i;
        uint64_t value = 0;
        while (i < str.size()) {
            int digit = hex ? hex_value(str[i])
                            : (std::isdigit(static_cast<unsigned char>(str[i])) ? str[i] - '0' : -1);
            if (digit < 0) break;
            if (value <= MAX_CODEPOINT) {
                value = value * (hex ? 16 : 10) + static_cast<uint64_t>(digit);
            }
            ++i;
        }
        if (i == digits_begin) return 0;
        if (i < str.size() && str[i] == ';') ++i;

        append_codepoint(out, value > MAX_CODEPOINT ? MAX_CODEPOINT + 1
                                                    : static_cast<uint32_t>(value));
        return i - pos;
    }

    size_t i = pos;
    while (i < str.size() && i - pos < 32 && is_name_char(str[i])) ++i;
    if (i == pos) return 0;

    std::string key(str.substr(pos, i - pos));
    if (i < str.size() && str[i] == ';') key += ';';

    auto it = named_entities().find(key);
    if (it != named_entities().end()) {
        out += it->second;
        return key.size();
    }

    // Longest entity that prefixes the name ("&ampx" -> "&x")
    for (size_t len = key.size() - 1; len >= 2; --len) {
        it = named_entities().find(key.substr(0, len));
        if (it != named_entities().end()) {
            out += it->second;
            return len;
        }
    }
    return 0;
}

}

std::string percent_decode(std::string_view str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += str[i];
    }
    return replace_invalid_utf8(result);
}

std::string html_unescape(std::string_view str) {
    if (str.find('&') == std::string_view::npos) {
        return std::string(str);
    }

    std::string result;
    result.reserve(str.size());

    size_t i = 0;
    while (i < str.size()) {
        if (str[i] != '&') {
            result += str[i++];
            continue;
        }
        size_t consumed = decode_reference(str, i + 1, result);
        if (consumed == 0) {
            result += '&';
            ++i;
        } else {
            i += 1 + consumed;
        }
    }
    return result;
}

std::string decode_url(std::string_view raw_url) {
    return html_unescape(percent_decode(raw_url));
}

}
