#pragma once

#include <optional>
#include <string>

namespace cleanpath {

struct Url {
    std::string scheme;
    std::string authority;  // host[:port], empty for origin-form targets
    std::string path;
    std::string query;
    std::string fragment;
    bool has_query = false;
    bool has_fragment = false;

    bool is_absolute() const { return !scheme.empty(); }
};

class UrlUtils {
public:
    // Parse an absolute URL or an origin-form request target ("/path?query").
    // Anything starting with '/' is origin-form, so "//a" is a path.
    static std::optional<Url> parse(const std::string& text);

    // Reassemble; origin-form when there is no scheme
    static std::string serialize(const Url& url);

    // Copy of the URL with its path replaced
    static Url with_path(const Url& url, const std::string& path);
};

} // namespace cleanpath
