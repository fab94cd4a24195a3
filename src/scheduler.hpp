#pragma once

#include "checker.hpp"
#include "inventory_source.hpp"
#include "notifier.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class SchedulerState {
    Idle,
    Running,
    StopRequested,
    Stopped
};

std::string to_string(SchedulerState state);

struct SchedulerOptions {
    std::chrono::milliseconds interval{std::chrono::minutes(720)};
    int fetch_attempts = 3;
    std::chrono::milliseconds retry_delay{std::chrono::seconds(5)};
    int purge_every_cycles = 24;
    std::chrono::milliseconds cache_retention{std::chrono::hours(24 * 30)};
};

struct SchedulerStats {
    uint64_t cycles = 0;
    uint64_t failed_fetches = 0;
    uint64_t notifications = 0;
    uint64_t chunks_delivered = 0;
    size_t last_product_count = 0;
    int64_t started_at_ms = 0;
    int64_t last_cycle_ms = 0;
    int64_t last_success_ms = 0;
    int64_t next_tick_ms = 0;
};

// Runs fetch -> check -> notify cycles on a fixed interval until stopped.
//
// run() blocks the calling thread; stop() may be called from any other
// thread and returns once the loop has exited.
class Scheduler {
public:
    Scheduler(InventorySource& source,
              std::vector<std::shared_ptr<Checker>> checkers,
              Notifier& notifier,
              SchedulerOptions options,
              std::shared_ptr<spdlog::logger> log);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Throws std::logic_error when called a second time. Returns at once
    // if stop() came first.
    void run();

    // Idempotent.
    void stop();

    SchedulerState state() const;
    SchedulerStats stats() const;
    const SchedulerOptions& options() const { return options_; }

private:
    InventorySource& source_;
    std::vector<std::shared_ptr<Checker>> checkers_;
    Notifier& notifier_;
    SchedulerOptions options_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SchedulerState state_ = SchedulerState::Idle;
    bool run_called_ = false;

    mutable std::mutex stats_mutex_;
    SchedulerStats stats_;

    void loop();
    void run_cycle(uint64_t cycle);
    std::optional<DomainSnapshot> fetch_with_retry();
    size_t deliver(std::vector<Notification> notifications);
    void purge_caches();

    bool stop_requested() const;
    // Returns true when woken by a stop request.
    bool wait_until(std::chrono::steady_clock::time_point deadline);
    void mark_stopped();
};
