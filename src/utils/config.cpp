#include "config.h"
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace cleanpath {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    *this = Config();
}

bool Config::load(const std::string& config_path) {
    last_error_.clear();
    try {
        YAML::Node config = YAML::LoadFile(config_path);

        // Server
        if (config["server"]) {
            auto server = config["server"];
            if (server["host"]) server_host_ = server["host"].as<std::string>();
            if (server["port"]) server_port_ = server["port"].as<int>();
            if (server["threads"]) server_threads_ = server["threads"].as<int>();
        }

        // Clean path
        if (config["clean_path"]) {
            auto cp = config["clean_path"];
            if (cp["enabled"]) clean_path_enabled_ = cp["enabled"].as<bool>();
            if (cp["redirect_status"]) {
                int status = cp["redirect_status"].as<int>();
                if (status != 301 && status != 308) {
                    throw std::runtime_error("clean_path.redirect_status must be 301 or 308, got " +
                                             std::to_string(status));
                }
                clean_path_redirect_status_ = status;
            }
            if (cp["scheme"]) clean_path_scheme_ = cp["scheme"].as<std::string>();
            if (cp["absolute_location"]) clean_path_absolute_location_ = cp["absolute_location"].as<bool>();
            if (cp["exempt_paths"]) {
                clean_path_exempt_paths_.clear();
                for (const auto& item : cp["exempt_paths"]) {
                    clean_path_exempt_paths_.push_back(item.as<std::string>());
                }
            }
        }

        // Logging
        if (config["logging"]) {
            auto logging = config["logging"];
            if (logging["level"]) log_level_ = logging["level"].as<std::string>();
            if (logging["format"]) log_format_ = logging["format"].as<std::string>();
            if (logging["output"]) log_output_ = logging["output"].as<std::string>();
        }

        if (server_port_ <= 0 || server_port_ > 65535) {
            throw std::runtime_error("server.port out of range: " + std::to_string(server_port_));
        }
        if (server_threads_ <= 0) {
            throw std::runtime_error("server.threads must be positive");
        }

        return true;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }
}

} // namespace cleanpath
