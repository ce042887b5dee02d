#include "path_canonicalizer.h"
#include <utility>
#include <vector>

namespace cleanpath {

namespace {

bool ends_with_slash(std::string_view path) {
    return !path.empty() && path.back() == '/';
}

} // namespace

Canonicalization PathCanonicalizer::canonicalize(std::string_view path) {
    Canonicalization result;
    if (is_canonical_fast(path)) {
        return result;
    }

    std::string rewritten = rewrite(path);
    if (rewritten != path) {
        result.kind = Canonicalization::Kind::Redirect;
        result.path = std::move(rewritten);
    }
    return result;
}

std::string PathCanonicalizer::rewrite(std::string_view path) {
    std::string result = clean(path);
    if (result != "/" && (ends_with_slash(path) || !has_extension(result))) {
        result.push_back('/');
    }
    return result;
}

std::string PathCanonicalizer::clean(std::string_view path) {
    std::vector<std::string_view> segments;

    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        std::string_view segment = path.substr(pos, next - pos);
        pos = next + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            // At the root there is no parent to step back into
            if (!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(segment);
    }

    if (segments.empty()) {
        return "/";
    }

    size_t length = 0;
    for (const auto& segment : segments) {
        length += segment.size() + 1;
    }

    std::string result;
    result.reserve(length + 1);
    for (const auto& segment : segments) {
        result.push_back('/');
        result.append(segment.data(), segment.size());
    }
    return result;
}

bool PathCanonicalizer::is_canonical_fast(std::string_view path) {
    if (path.find("/.") != std::string_view::npos) return false;
    if (path.find("//") != std::string_view::npos) return false;
    return has_extension(path) != ends_with_slash(path);
}

bool PathCanonicalizer::has_extension(std::string_view path) {
    size_t dot = path.rfind('.');
    if (dot == std::string_view::npos) {
        return false;
    }
    std::string_view suffix = path.substr(dot + 1);
    return !suffix.empty() && suffix.find('/') == std::string_view::npos;
}

} // namespace cleanpath
