#pragma once

#include <string>
#include <string_view>

namespace urlfeat {

struct RawUrlParts {
    std::string protocol;
    std::string domain;
    std::string path;
    std::string args;
};

/**
 * Splits a decoded URL into protocol, domain, path and argument strings.
 * Matching is done against the lowercased URL and anchored at its start;
 * trailing characters outside the grammar are ignored.
 * @throws MalformedUrlError when no http(s) protocol + domain prefix matches
 */
RawUrlParts split_raw_url(std::string_view decoded_url);

}
