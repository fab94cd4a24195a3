#include "health.hpp"
#include "util.hpp"

bool HealthCheck::evaluate(SchedulerState state, const SchedulerStats& stats,
                           std::chrono::milliseconds interval, int64_t now_ms) {
    if (state != SchedulerState::Running) return false;

    int64_t reference = stats.last_success_ms > 0 ? stats.last_success_ms
                                                  : stats.started_at_ms;
    return now_ms - reference < 3 * interval.count();
}

bool HealthCheck::is_healthy(int64_t now_ms) const {
    return evaluate(scheduler_.state(), scheduler_.stats(),
                    scheduler_.options().interval, now_ms);
}

nlohmann::json HealthCheck::get_status(int64_t now_ms) const {
    auto state = scheduler_.state();
    auto stats = scheduler_.stats();
    bool ok = evaluate(state, stats, scheduler_.options().interval, now_ms);

    auto when = [](int64_t ts_ms) -> nlohmann::json {
        if (ts_ms <= 0) return nullptr;
        return util::format_datetime(ts_ms) + " UTC";
    };

    nlohmann::json status = {
        {"ok", ok},
        {"service", service_name_},
        {"scheduler", to_string(state)},
        {"cycles", stats.cycles},
        {"failed_fetches", stats.failed_fetches},
        {"notifications", stats.notifications},
        {"messages_sent", stats.chunks_delivered},
        {"products", stats.last_product_count},
        {"last_cycle", when(stats.last_cycle_ms)},
        {"last_success", when(stats.last_success_ms)},
        {"next_check", when(stats.next_tick_ms)}
    };

    return status;
}
