#pragma once

#include <string>
#include <vector>

namespace cleanpath {

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_path);
    const std::string& last_error() const { return last_error_; }

    // Server
    std::string server_host() const { return server_host_; }
    int server_port() const { return server_port_; }
    int server_threads() const { return server_threads_; }

    // Clean path middleware
    bool clean_path_enabled() const { return clean_path_enabled_; }
    int clean_path_redirect_status() const { return clean_path_redirect_status_; }
    std::string clean_path_scheme() const { return clean_path_scheme_; }
    bool clean_path_absolute_location() const { return clean_path_absolute_location_; }
    const std::vector<std::string>& clean_path_exempt_paths() const { return clean_path_exempt_paths_; }

    // Logging
    std::string log_level() const { return log_level_; }
    std::string log_format() const { return log_format_; }
    std::string log_output() const { return log_output_; }

    // Restore built-in defaults
    void reset();

private:
    Config() = default;

    std::string server_host_ = "0.0.0.0";
    int server_port_ = 8080;
    int server_threads_ = 4;

    bool clean_path_enabled_ = true;
    int clean_path_redirect_status_ = 308;
    std::string clean_path_scheme_ = "http";
    bool clean_path_absolute_location_ = true;
    std::vector<std::string> clean_path_exempt_paths_ = {"/health", "/metrics"};

    std::string log_level_ = "info";
    std::string log_format_ = "text";
    std::string log_output_ = "stdout";

    std::string last_error_;
};

} // namespace cleanpath
