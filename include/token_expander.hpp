#pragma once

#include <string>
#include <vector>

#include "acronym_table.hpp"
#include "url_data.hpp"

namespace urlfeat {

// Replaces each token by its expansion, flattening multi-word phrases in place
std::vector<std::string> expand_tokens(const std::vector<std::string>& tokens,
                                       const AcronymTable& acronyms);

// Expands every zone except the domain ending
UrlData expand_url_data(const UrlData& data, const AcronymTable& acronyms);

}
