#pragma once

#include "scheduler.hpp"
#include <nlohmann/json.hpp>
#include <string>

class HealthCheck {
public:
    HealthCheck(const Scheduler& scheduler, std::string service_name)
        : scheduler_(scheduler), service_name_(std::move(service_name)) {}

    nlohmann::json get_status(int64_t now_ms) const;

    // Running, and the last successful fetch (or the start, before the
    // first one) is less than three intervals old.
    bool is_healthy(int64_t now_ms) const;

private:
    const Scheduler& scheduler_;
    std::string service_name_;

    static bool evaluate(SchedulerState state, const SchedulerStats& stats,
                         std::chrono::milliseconds interval, int64_t now_ms);
};
