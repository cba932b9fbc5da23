#include "token_expander.hpp"

#include "lexical.hpp"

namespace urlfeat {

std::vector<std::string> expand_tokens(const std::vector<std::string>& tokens,
                                       const AcronymTable& acronyms) {
    std::vector<std::string> expanded;
    expanded.reserve(tokens.size());
    for (const auto& token : tokens) {
        append(expanded, acronyms.expand(token));
    }
    return expanded;
}

UrlData expand_url_data(const UrlData& data, const AcronymTable& acronyms) {
    UrlData expanded;
    expanded.protocol = data.protocol;
    expanded.domains.sub_domains = expand_tokens(data.domains.sub_domains, acronyms);
    expanded.domains.main_domain = expand_tokens(data.domains.main_domain, acronyms);
    expanded.domains.domain_ending = data.domains.domain_ending;
    expanded.path = expand_tokens(data.path, acronyms);

    expanded.args.reserve(data.args.size());
    for (const auto& pair : data.args) {
        expanded.args.push_back({expand_tokens(pair.param, acronyms),
                                 expand_tokens(pair.value, acronyms)});
    }
    return expanded;
}

}
