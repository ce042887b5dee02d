#pragma once

#include <string>
#include <string_view>

namespace cleanpath {

struct Canonicalization {
    enum class Kind {
        Unchanged,
        Redirect
    };

    Kind kind = Kind::Unchanged;
    std::string path;  // only set for Redirect

    bool is_redirect() const { return kind == Kind::Redirect; }
};

class PathCanonicalizer {
public:
    // Unchanged if the path is already canonical, otherwise the canonical path
    static Canonicalization canonicalize(std::string_view path);

    // Clean the path and apply the trailing slash policy
    static std::string rewrite(std::string_view path);

    // Merge slashes, drop "." and resolve ".." (never above "/")
    static std::string clean(std::string_view path);

    // Non-allocating check: no "/.", no "//", extension XOR trailing slash
    static bool is_canonical_fast(std::string_view path);

    // True if the last '.' is followed by at least one char and no '/'
    static bool has_extension(std::string_view path);
};

} // namespace cleanpath
