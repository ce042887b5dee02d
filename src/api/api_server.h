#pragma once

#include <string>
#include <memory>

namespace cleanpath {

class ApiServer {
public:
    ApiServer();
    ~ApiServer();

    // Initialize server
    bool init(const std::string& host, int port, int threads);

    // Start server (blocking)
    void start();

    // Stop server
    void stop();

private:
    struct Impl;

    void setup_routes();

    std::string host_;
    int port_ = 0;
    int threads_ = 1;

    std::unique_ptr<Impl> impl_;
};

} // namespace cleanpath
