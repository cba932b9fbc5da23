#pragma once

#include <string>
#include <string_view>

namespace urlfeat {

// %XX unescape; malformed escapes are kept verbatim and invalid UTF-8 in
// the result becomes U+FFFD
std::string percent_decode(std::string_view str);

// HTML5 named (with or without trailing ';' for legacy entities) and numeric
// character references; unknown references are kept verbatim
std::string html_unescape(std::string_view str);

// percent_decode followed by html_unescape
std::string decode_url(std::string_view raw_url);

}
