#include "url_splitter.hpp"

#include "errors.hpp"
#include "lexical.hpp"

#include <re2/re2.h>

namespace urlfeat {

namespace {

const RE2& url_pattern() {
    static const RE2 pattern(
        R"re(^(https?):\/\/)re"                              // protocol
        R"re(([-a-zA-Z0-9@:%._\+~#=]+\.[a-zA-Z0-9()]{1,12}))re" // domains
        R"re(\b)re"
        R"re(([-a-zA-Z0-9()@:%_\+;.~#&\/=]*))re"              // path
        R"re(\??)re"
        R"re(([-a-zA-Z0-9()@:%_\+;.~#&\/=?\\]*))re");         // args
    return pattern;
}

}

RawUrlParts split_raw_url(std::string_view decoded_url) {
    const std::string lowered = to_lower(decoded_url);

    RawUrlParts parts;
    if (!RE2::PartialMatch(lowered, url_pattern(),
                           &parts.protocol, &parts.domain, &parts.path, &parts.args)) {
        throw MalformedUrlError(std::string(decoded_url));
    }
    return parts;
}

}
