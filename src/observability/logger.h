#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <memory>

namespace cleanpath {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    // level: debug|info|warn|error, format: text|json, output: stdout or a file path
    bool init(const std::string& level, const std::string& format, const std::string& output);

    bool enabled(LogLevel level) const { return level >= min_level_; }

    void log(LogLevel level, const std::string& message, const std::string& target = "");
    void debug(const std::string& message, const std::string& target = "");
    void info(const std::string& message, const std::string& target = "");
    void warn(const std::string& message, const std::string& target = "");
    void error(const std::string& message, const std::string& target = "");

    // Format a line without writing it
    std::string format_message(LogLevel level, const std::string& message, const std::string& target) const;

private:
    Logger() = default;

    static const char* level_to_string(LogLevel level);

    LogLevel min_level_ = LogLevel::INFO;
    bool json_format_ = false;
    std::unique_ptr<std::ofstream> file_output_;
    std::mutex log_mutex_;
};

} // namespace cleanpath
