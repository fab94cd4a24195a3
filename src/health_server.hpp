#pragma once

#include "health.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

// Serves GET /health on its own thread.
class HealthServer {
public:
    HealthServer(const HealthCheck& health, std::string listen_addr, int listen_port);
    ~HealthServer();

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

private:
    const HealthCheck& health_;
    std::string listen_addr_;
    int listen_port_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    void setup_routes();
    void handle_health(const httplib::Request& req, httplib::Response& res);
};
