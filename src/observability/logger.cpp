#include "logger.h"
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <nlohmann/json.hpp>

namespace cleanpath {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

bool Logger::init(const std::string& level, const std::string& format, const std::string& output) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (level == "debug") min_level_ = LogLevel::DEBUG;
    else if (level == "info") min_level_ = LogLevel::INFO;
    else if (level == "warn") min_level_ = LogLevel::WARN;
    else if (level == "error") min_level_ = LogLevel::ERROR;

    json_format_ = (format == "json");

    file_output_.reset();
    if (output != "stdout" && !output.empty()) {
        file_output_ = std::make_unique<std::ofstream>(output, std::ios::app);
        if (!file_output_->is_open()) {
            file_output_.reset();
            return false;
        }
    }
    return true;
}

void Logger::log(LogLevel level, const std::string& message, const std::string& target) {
    if (!enabled(level)) return;

    std::string formatted = format_message(level, message, target);

    std::lock_guard<std::mutex> lock(log_mutex_);
    if (file_output_) {
        *file_output_ << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }
}

void Logger::debug(const std::string& message, const std::string& target) {
    log(LogLevel::DEBUG, message, target);
}

void Logger::info(const std::string& message, const std::string& target) {
    log(LogLevel::INFO, message, target);
}

void Logger::warn(const std::string& message, const std::string& target) {
    log(LogLevel::WARN, message, target);
}

void Logger::error(const std::string& message, const std::string& target) {
    log(LogLevel::ERROR, message, target);
}

std::string Logger::format_message(LogLevel level, const std::string& message, const std::string& target) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    std::ostringstream ts;
    ts << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

    if (json_format_) {
        nlohmann::json line;
        line["timestamp"] = ts.str();
        line["level"] = level_to_string(level);
        if (!target.empty()) {
            line["target"] = target;
        }
        line["message"] = message;
        return line.dump();
    }

    std::ostringstream oss;
    oss << ts.str() << " [" << level_to_string(level) << "]";
    if (!target.empty()) {
        oss << " [" << target << "]";
    }
    oss << " " << message;
    return oss.str();
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace cleanpath
