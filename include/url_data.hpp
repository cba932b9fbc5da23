#pragma once

#include <string>
#include <vector>

namespace urlfeat {

struct DomainData {
    std::vector<std::string> sub_domains;
    std::vector<std::string> main_domain;
    std::string domain_ending;

    bool operator==(const DomainData& other) const {
        return sub_domains == other.sub_domains &&
               main_domain == other.main_domain &&
               domain_ending == other.domain_ending;
    }
};

struct ArgPair {
    std::vector<std::string> param;
    std::vector<std::string> value;

    bool operator==(const ArgPair& other) const {
        return param == other.param && value == other.value;
    }
};

struct UrlData {
    std::string protocol;
    DomainData domains;
    std::vector<std::string> path;
    std::vector<ArgPair> args;

    bool operator==(const UrlData& other) const {
        return protocol == other.protocol && domains == other.domains &&
               path == other.path && args == other.args;
    }
};

// Parameter and value tokens of every pair, in pair order
std::vector<std::string> flatten_args(const std::vector<ArgPair>& args);

// protocol, sub-domains, main domain, TLD, path, flattened args
std::vector<std::string> flatten_url_data(const UrlData& data);

}
