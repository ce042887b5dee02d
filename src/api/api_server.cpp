#include "api_server.h"
#include "../middleware/clean_path.h"
#include "../observability/logger.h"
#include "../observability/metrics.h"
#include "../utils/config.h"
#include <atomic>
#include <crow.h>
#include <nlohmann/json.hpp>

namespace cleanpath {

struct ApiServer::Impl {
    crow::App<CleanPath> app;
    std::atomic<bool> running{false};
};

ApiServer::ApiServer() : impl_(std::make_unique<Impl>()) {}

ApiServer::~ApiServer() {
    stop();
}

bool ApiServer::init(const std::string& host, int port, int threads) {
    if (port <= 0 || port > 65535 || threads <= 0) {
        Logger::instance().error("invalid server settings: port=" + std::to_string(port) +
                                 " threads=" + std::to_string(threads));
        return false;
    }
    host_ = host;
    port_ = port;
    threads_ = threads;

    auto& config = Config::instance();
    impl_->app.get_middleware<CleanPath>().configure(CleanPathOptions::from_config(),
                                                     config.clean_path_enabled());
    setup_routes();
    return true;
}

void ApiServer::setup_routes() {
    auto& app = impl_->app;

    // Health check
    CROW_ROUTE(app, "/health")
    .methods("GET"_method)
    ([]() {
        auto& metrics = Metrics::instance();
        nlohmann::json result;
        result["status"] = "healthy";
        result["redirects"] = metrics.get_counter("clean_path_redirects_total");
        result["passthrough"] = metrics.get_counter("clean_path_passthrough_total");
        crow::response res(200);
        res.body = result.dump();
        res.set_header("Content-Type", "application/json");
        return res;
    });

    // Metrics endpoint, Prometheus text unless ?format=json
    CROW_ROUTE(app, "/metrics")
    .methods("GET"_method)
    ([](const crow::request& req) {
        auto& metrics = Metrics::instance();
        const char* format = req.url_params.get("format");
        crow::response res(200);
        if (format && std::string(format) == "json") {
            res.body = metrics.to_json();
            res.set_header("Content-Type", "application/json");
        } else {
            res.body = metrics.to_prometheus();
            res.set_header("Content-Type", "text/plain; version=0.0.4");
        }
        return res;
    });

    // Everything that got past CleanPath is canonical
    CROW_CATCHALL_ROUTE(app)
    ([](const crow::request& req) {
        nlohmann::json result;
        result["path"] = req.url;
        crow::response res(200);
        res.body = result.dump();
        res.set_header("Content-Type", "application/json");
        return res;
    });
}

void ApiServer::start() {
    Logger::instance().info("listening on " + host_ + ":" + std::to_string(port_) +
                            " with " + std::to_string(threads_) + " threads");
    auto& metrics = Metrics::instance();
    metrics.set_gauge("clean_path_enabled", Config::instance().clean_path_enabled() ? 1.0 : 0.0);
    metrics.set_gauge("server_up", 1.0);
    impl_->running = true;
    impl_->app.bindaddr(host_).port(static_cast<uint16_t>(port_)).concurrency(static_cast<uint16_t>(threads_)).run();
    impl_->running = false;
    metrics.set_gauge("server_up", 0.0);
}

void ApiServer::stop() {
    if (impl_ && impl_->running.exchange(false)) {
        impl_->app.stop();
    }
}

} // namespace cleanpath
