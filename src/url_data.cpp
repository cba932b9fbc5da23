#include "url_data.hpp"

#include "lexical.hpp"

namespace urlfeat {

std::vector<std::string> flatten_args(const std::vector<ArgPair>& args) {
    std::vector<std::string> tokens;
    for (const auto& pair : args) {
        append(tokens, pair.param);
        append(tokens, pair.value);
    }
    return tokens;
}

std::vector<std::string> flatten_url_data(const UrlData& data) {
    std::vector<std::string> words;
    words.push_back(data.protocol);
    append(words, data.domains.sub_domains);
    append(words, data.domains.main_domain);
    words.push_back(data.domains.domain_ending);
    append(words, data.path);
    append(words, flatten_args(data.args));
    return words;
}

}
