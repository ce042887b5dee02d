#include "url_utils.h"
#include <regex>

namespace cleanpath {

namespace {

// Split "path?query#fragment" into the URL's path, query and fragment
void split_target(const std::string& target, Url& url) {
    size_t hash_pos = target.find('#');
    std::string rest = target;
    if (hash_pos != std::string::npos) {
        url.has_fragment = true;
        url.fragment = target.substr(hash_pos + 1);
        rest = target.substr(0, hash_pos);
    }

    size_t query_pos = rest.find('?');
    if (query_pos != std::string::npos) {
        url.has_query = true;
        url.query = rest.substr(query_pos + 1);
        rest.resize(query_pos);
    }
    url.path = rest;
}

} // namespace

std::optional<Url> UrlUtils::parse(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    Url url;
    if (text[0] == '/') {
        split_target(text, url);
        return url;
    }

    static const std::regex absolute_regex(R"(^([A-Za-z][A-Za-z0-9+.\-]*)://([^/?#]*)(.*)$)");
    std::smatch match;
    if (!std::regex_match(text, match, absolute_regex)) {
        return std::nullopt;
    }

    url.scheme = match[1].str();
    url.authority = match[2].str();
    split_target(match[3].str(), url);
    if (url.authority.empty()) {
        return std::nullopt;
    }
    return url;
}

std::string UrlUtils::serialize(const Url& url) {
    std::string result;
    if (url.is_absolute()) {
        result += url.scheme;
        result += "://";
        result += url.authority;
    }
    result += url.path;
    if (url.has_query) {
        result += '?';
        result += url.query;
    }
    if (url.has_fragment) {
        result += '#';
        result += url.fragment;
    }
    return result;
}

Url UrlUtils::with_path(const Url& url, const std::string& path) {
    Url copy = url;
    copy.path = path;
    return copy;
}

} // namespace cleanpath
