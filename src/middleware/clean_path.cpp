#include "clean_path.h"
#include "../observability/logger.h"
#include "../observability/metrics.h"
#include "../utils/config.h"

namespace cleanpath {

static const std::string kRequestDurationMetric = "request_duration_us";

CleanPath::CleanPath()
    : resolver_(CleanPathOptions::from_config()),
      enabled_(Config::instance().clean_path_enabled()),
      passthrough_total_(&Metrics::instance().counter("clean_path_passthrough_total")),
      redirects_total_(&Metrics::instance().counter("clean_path_redirects_total")) {}

void CleanPath::configure(CleanPathOptions options, bool enabled) {
    resolver_ = RedirectResolver(std::move(options));
    enabled_ = enabled;
}

void CleanPath::before_handle(crow::request& req, crow::response& res, context& ctx) {
    ctx.start = std::chrono::steady_clock::now();
    if (!enabled_) return;

    RedirectDecision decision = resolver_.resolve(req.raw_url, req.get_header_value("Host"));
    if (!decision.redirect) {
        passthrough_total_->fetch_add(1, std::memory_order_relaxed);
        return;
    }

    auto& logger = Logger::instance();
    if (logger.enabled(LogLevel::DEBUG)) {
        logger.debug("redirect " + std::to_string(decision.status) + " -> " + decision.location, req.raw_url);
    }
    redirects_total_->fetch_add(1, std::memory_order_relaxed);

    res.code = decision.status;
    res.set_header("Location", decision.location);
    res.end();
}

void CleanPath::after_handle(crow::request& /*req*/, crow::response& /*res*/, context& ctx) {
    auto elapsed = std::chrono::steady_clock::now() - ctx.start;
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
    Metrics::instance().record_histogram(kRequestDurationMetric, static_cast<double>(us));
}

} // namespace cleanpath
