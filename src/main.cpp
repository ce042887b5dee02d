#include <iostream>
#include <string>
#include "utils/config.h"
#include "api/api_server.h"
#include "observability/logger.h"

using namespace cleanpath;

int main(int argc, char* argv[]) {
    std::string config_path = "configs/config.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    // Load configuration
    auto& config = Config::instance();
    if (!config.load(config_path)) {
        std::cerr << "Failed to load config from " << config_path << ": " << config.last_error() << std::endl;
        return 1;
    }

    // Initialize logger
    auto& logger = Logger::instance();
    if (!logger.init(config.log_level(), config.log_format(), config.log_output())) {
        std::cerr << "Failed to open log output " << config.log_output() << std::endl;
        return 1;
    }
    logger.info("Starting cleanpath service");
    if (!config.clean_path_enabled()) {
        logger.warn("clean_path middleware disabled by config");
    }

    ApiServer api_server;
    if (!api_server.init(config.server_host(), config.server_port(), config.server_threads())) {
        logger.error("Failed to initialize API server");
        return 1;
    }

    try {
        api_server.start();
    } catch (const std::exception& e) {
        logger.error(std::string("API server failed: ") + e.what());
        return 1;
    }

    logger.info("cleanpath service stopped");
    return 0;
}
