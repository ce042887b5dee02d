#include "redirect_resolver.h"
#include "../canonical/path_canonicalizer.h"
#include "../utils/config.h"
#include "../utils/url_utils.h"
#include <algorithm>
#include <optional>
#include <utility>

namespace cleanpath {

CleanPathOptions CleanPathOptions::from_config() {
    auto& config = Config::instance();
    CleanPathOptions options;
    options.redirect_status = config.clean_path_redirect_status();
    options.scheme = config.clean_path_scheme();
    options.absolute_location = config.clean_path_absolute_location();
    options.exempt_paths = config.clean_path_exempt_paths();
    return options;
}

RedirectResolver::RedirectResolver(CleanPathOptions options)
    : options_(std::move(options)) {}

RedirectDecision RedirectResolver::resolve(const std::string& target, const std::string& host) const {
    RedirectDecision decision;

    // Origin-form targets are checked in place; the URL is only parsed
    // once a redirect has to be built.
    std::optional<Url> url;
    std::string_view path;
    if (!target.empty() && target[0] == '/') {
        path = std::string_view(target).substr(0, target.find_first_of("?#"));
    } else {
        url = UrlUtils::parse(target);
        if (!url || url->path.empty() || url->path[0] != '/') {
            // asterisk-form and anything unparseable is left to the router
            return decision;
        }
        path = url->path;
    }

    std::string canonical;
    if (!canonical_target(path, canonical)) {
        return decision;
    }

    if (!url) {
        url = UrlUtils::parse(target);
        if (!url) return decision;
    }
    Url redirected = UrlUtils::with_path(*url, canonical);
    if (!redirected.is_absolute() && options_.absolute_location && !host.empty()) {
        redirected.scheme = options_.scheme;
        redirected.authority = host;
    }

    decision.redirect = true;
    decision.status = options_.redirect_status;
    decision.location = UrlUtils::serialize(redirected);
    decision.canonical_path = std::move(canonical);
    return decision;
}

bool RedirectResolver::canonical_target(std::string_view path, std::string& canonical) const {
    if (is_exempt(path)) {
        return false;
    }

    Canonicalization result = PathCanonicalizer::canonicalize(path);
    std::string_view cleaned = result.is_redirect() ? std::string_view(result.path) : path;

    // Exempt routes are registered without the slash the policy appends
    if (cleaned.size() > 1 && cleaned.back() == '/') {
        std::string_view bare = cleaned.substr(0, cleaned.size() - 1);
        if (is_exempt(bare)) {
            canonical.assign(bare.data(), bare.size());
            return true;
        }
    }

    if (!result.is_redirect()) {
        return false;
    }
    canonical = std::move(result.path);
    return true;
}

bool RedirectResolver::is_exempt(std::string_view path) const {
    return std::any_of(options_.exempt_paths.begin(), options_.exempt_paths.end(),
                       [path](const std::string& exempt) { return exempt == path; });
}

} // namespace cleanpath
