#pragma once

#include "redirect_resolver.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <crow.h>

namespace cleanpath {

// Crow middleware: redirects every request whose path is not canonical
// before it reaches the router.
struct CleanPath {
    struct context {
        std::chrono::steady_clock::time_point start;
    };

    CleanPath();

    void before_handle(crow::request& req, crow::response& res, context& ctx);

    // Records the request duration, redirects included
    void after_handle(crow::request& req, crow::response& res, context& ctx);

    // Replaces the options read from Config at construction
    void configure(CleanPathOptions options, bool enabled = true);

private:
    RedirectResolver resolver_;
    bool enabled_;
    std::atomic<int64_t>* passthrough_total_;
    std::atomic<int64_t>* redirects_total_;
};

} // namespace cleanpath
