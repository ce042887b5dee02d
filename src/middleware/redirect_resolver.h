#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cleanpath {

struct CleanPathOptions {
    int redirect_status = 308;
    std::string scheme = "http";
    bool absolute_location = true;
    std::vector<std::string> exempt_paths;

    // Options from the loaded Config
    static CleanPathOptions from_config();
};

struct RedirectDecision {
    bool redirect = false;
    int status = 0;
    std::string location;        // value for the Location header
    std::string canonical_path;
};

class RedirectResolver {
public:
    explicit RedirectResolver(CleanPathOptions options);

    // target: raw request target as received ("/a//b?x=1"),
    // host: Host header value, may be empty
    RedirectDecision resolve(const std::string& target, const std::string& host) const;

    const CleanPathOptions& options() const { return options_; }

private:
    // True when path must move; canonical receives the new path
    bool canonical_target(std::string_view path, std::string& canonical) const;
    bool is_exempt(std::string_view path) const;

    CleanPathOptions options_;
};

} // namespace cleanpath
