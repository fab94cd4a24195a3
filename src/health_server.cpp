#include "health_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

HealthServer::HealthServer(const HealthCheck& health, std::string listen_addr, int listen_port)
    : health_(health)
    , listen_addr_(std::move(listen_addr))
    , listen_port_(listen_port)
    , server_(std::make_unique<httplib::Server>())
{}

HealthServer::~HealthServer() {
    stop();
}

void HealthServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}", listen_addr_, listen_port_);
        if (!server_->listen(listen_addr_.c_str(), listen_port_)) {
            if (running_) {
                spdlog::error("Health server failed to listen on {}:{}", listen_addr_, listen_port_);
            }
        }
    });
}

void HealthServer::stop() {
    if (!running_) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("Health server stopped");
}

void HealthServer::setup_routes() {
    server_->Get("/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
}

void HealthServer::handle_health(const httplib::Request&, httplib::Response& res) {
    int64_t now_ms = util::current_timestamp_ms();
    auto status = health_.get_status(now_ms);

    res.status = status.value("ok", false) ? 200 : 503;
    res.set_content(status.dump(), "application/json");
}
