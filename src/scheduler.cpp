#include "scheduler.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

std::string to_string(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle: return "idle";
        case SchedulerState::Running: return "running";
        case SchedulerState::StopRequested: return "stopping";
        case SchedulerState::Stopped: return "stopped";
    }
    return "unknown";
}

Scheduler::Scheduler(InventorySource& source,
                     std::vector<std::shared_ptr<Checker>> checkers,
                     Notifier& notifier,
                     SchedulerOptions options,
                     std::shared_ptr<spdlog::logger> log)
    : source_(source)
    , checkers_(std::move(checkers))
    , notifier_(notifier)
    , options_(options)
    , log_(std::move(log))
{}

void Scheduler::run() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (run_called_) {
            throw std::logic_error("Scheduler::run() called twice");
        }
        run_called_ = true;

        if (state_ == SchedulerState::Stopped) {
            log_->info("Scheduler stopped before start");
            return;
        }
        state_ = SchedulerState::Running;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.started_at_ms = util::current_timestamp_ms();
    }

    log_->info("Scheduler started: interval {}s, {} checkers",
               std::chrono::duration_cast<std::chrono::seconds>(options_.interval).count(),
               checkers_.size());

    try {
        loop();
    } catch (...) {
        mark_stopped();
        throw;
    }

    mark_stopped();
    log_->info("Scheduler stopped");
}

void Scheduler::loop() {
    uint64_t cycle = 0;

    while (!stop_requested()) {
        auto cycle_start = std::chrono::steady_clock::now();
        cycle++;

        run_cycle(cycle);

        if (options_.purge_every_cycles > 0 &&
            cycle % static_cast<uint64_t>(options_.purge_every_cycles) == 0) {
            purge_caches();
        }

        auto next_tick = cycle_start + options_.interval;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            next_tick - std::chrono::steady_clock::now());
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.next_tick_ms = util::current_timestamp_ms() +
                                  std::max<int64_t>(remaining.count(), 0);
        }

        if (wait_until(next_tick)) {
            break;
        }
    }
}

void Scheduler::run_cycle(uint64_t cycle) {
    log_->info("Cycle {} started", cycle);
    int64_t cycle_ms = util::current_timestamp_ms();

    auto snapshot = fetch_with_retry();
    if (!snapshot) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.cycles++;
        stats_.failed_fetches++;
        stats_.last_cycle_ms = cycle_ms;
        return;
    }

    std::vector<Notification> produced;
    for (const auto& checker : checkers_) {
        if (stop_requested()) {
            log_->info("Stop requested, skipping remaining checkers");
            break;
        }
        try {
            auto notifications = checker->check(*snapshot);
            log_->debug("[{}] produced {} notifications", checker->name(), notifications.size());
            produced.insert(produced.end(),
                            std::make_move_iterator(notifications.begin()),
                            std::make_move_iterator(notifications.end()));
        } catch (const std::exception& e) {
            log_->error("[{}] check failed: {}", checker->name(), e.what());
        }
    }

    size_t produced_count = produced.size();
    size_t delivered = deliver(std::move(produced));

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.cycles++;
        stats_.notifications += produced_count;
        stats_.chunks_delivered += delivered;
        stats_.last_product_count = snapshot->products.size();
        stats_.last_cycle_ms = cycle_ms;
        stats_.last_success_ms = cycle_ms;
    }

    log_->info("Cycle {} done: {} products, {} notifications, {} messages sent",
               cycle, snapshot->products.size(), produced_count, delivered);
}

std::optional<DomainSnapshot> Scheduler::fetch_with_retry() {
    int attempts = std::max(options_.fetch_attempts, 1);

    for (int attempt = 1; attempt <= attempts; attempt++) {
        if (stop_requested()) return std::nullopt;

        try {
            return source_.fetch_snapshot();
        } catch (const FetchError& e) {
            log_->warn("Fetch attempt {}/{} failed: {}", attempt, attempts, e.what());
        } catch (const std::exception& e) {
            log_->error("Fetch attempt {}/{} failed unexpectedly: {}", attempt, attempts, e.what());
        }

        if (attempt < attempts) {
            auto delay = options_.retry_delay * attempt;
            if (wait_until(std::chrono::steady_clock::now() + delay)) {
                return std::nullopt;
            }
        }
    }

    log_->error("Fetch failed after {} attempts, skipping cycle", attempts);
    return std::nullopt;
}

size_t Scheduler::deliver(std::vector<Notification> notifications) {
    if (notifications.empty()) return 0;

    std::stable_sort(notifications.begin(), notifications.end(),
        [](const Notification& a, const Notification& b) {
            return static_cast<int>(a.priority) > static_cast<int>(b.priority);
        });

    // One batch per header and loudness, in order of the highest priority
    // it contains.
    struct Batch {
        std::string header;
        bool silent;
        std::vector<std::string> blocks;
    };
    std::vector<Batch> batches;

    for (auto& n : notifications) {
        bool silent = n.priority == Priority::Low;
        auto it = std::find_if(batches.begin(), batches.end(), [&](const Batch& b) {
            return b.header == n.header && b.silent == silent;
        });
        if (it == batches.end()) {
            batches.push_back({n.header, silent, {}});
            it = batches.end() - 1;
        }
        it->blocks.push_back(std::move(n.text));
    }

    size_t delivered = 0;
    for (const auto& batch : batches) {
        delivered += notifier_.send(batch.header, batch.blocks, batch.silent);
    }
    return delivered;
}

void Scheduler::purge_caches() {
    int64_t now_ms = util::current_timestamp_ms();
    for (const auto& checker : checkers_) {
        size_t removed = checker->purge_expired(now_ms, options_.cache_retention);
        if (removed > 0) {
            log_->info("[{}] purged {} stale cache records", checker->name(), removed);
        }
    }
}

void Scheduler::stop() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (state_ == SchedulerState::Idle) {
        state_ = SchedulerState::Stopped;
        cv_.notify_all();
        return;
    }

    if (state_ == SchedulerState::Running) {
        log_->info("Scheduler stop requested");
        state_ = SchedulerState::StopRequested;
        cv_.notify_all();
    }

    cv_.wait(lock, [this] { return state_ == SchedulerState::Stopped; });
}

SchedulerState Scheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SchedulerStats Scheduler::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

bool Scheduler::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ != SchedulerState::Running;
}

bool Scheduler::wait_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_until(lock, deadline,
                          [this] { return state_ != SchedulerState::Running; });
}

void Scheduler::mark_stopped() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SchedulerState::Stopped;
    cv_.notify_all();
}
