#include <catch2/catch_test_macros.hpp>
#include "../src/expiration_checker.hpp"
#include "../src/health.hpp"
#include "../src/scheduler.hpp"
#include "../src/stock_checker.hpp"
#include "test_support.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

namespace {

using namespace std::chrono_literals;

class BrokenChecker : public Checker {
public:
    BrokenChecker(std::unique_ptr<CacheStore> cache, std::shared_ptr<spdlog::logger> log)
        : Checker(std::move(cache), std::chrono::hours(0), std::move(log)) {}

    std::string name() const override { return "broken"; }
    std::vector<Notification> check(const DomainSnapshot&) override {
        throw std::runtime_error("boom");
    }
};

// Asks the scheduler to stop from a side thread while its own check runs.
class StoppingChecker : public Checker {
public:
    StoppingChecker(std::unique_ptr<CacheStore> cache, std::shared_ptr<spdlog::logger> log)
        : Checker(std::move(cache), std::chrono::hours(0), std::move(log)) {}

    ~StoppingChecker() override {
        if (stopper.joinable()) stopper.join();
    }

    std::string name() const override { return "stopping"; }
    std::vector<Notification> check(const DomainSnapshot&) override {
        stopper = std::thread([this] { scheduler->stop(); });
        test::wait_for([this] { return scheduler->state() == SchedulerState::StopRequested; });

        Notification n;
        n.channel = "stock";
        n.header = "Late group";
        n.text = "Produced before stop";
        return {n};
    }

    Scheduler* scheduler = nullptr;
    std::thread stopper;
};

class CountingChecker : public Checker {
public:
    CountingChecker(std::unique_ptr<CacheStore> cache, std::shared_ptr<spdlog::logger> log)
        : Checker(std::move(cache), std::chrono::hours(0), std::move(log)) {}

    std::string name() const override { return "counting"; }
    std::vector<Notification> check(const DomainSnapshot&) override {
        calls++;
        return {};
    }

    std::atomic<int> calls{0};
};

std::shared_ptr<Checker> stock_checker(const test::TempDir& dir) {
    return std::make_shared<StockChecker>(
        std::make_unique<CacheStore>(dir.file("stocks_cache.json"), test::null_logger()),
        4, std::chrono::hours(168), test::null_logger());
}

std::shared_ptr<Checker> expiration_checker(const test::TempDir& dir) {
    return std::make_shared<ExpirationChecker>(
        std::make_unique<CacheStore>(dir.file("expiration_cache.json"), test::null_logger()),
        7, 3, std::chrono::hours(168), test::null_logger());
}

SchedulerOptions options_with_interval(std::chrono::milliseconds interval) {
    SchedulerOptions options;
    options.interval = interval;
    options.fetch_attempts = 1;
    options.retry_delay = 1ms;
    return options;
}

} // namespace

TEST_CASE("Scheduler lifecycle", "[scheduler]") {
    test::FakeSource source({test::snapshot_step({})});
    test::FakeTransport transport;
    Notifier notifier(transport, "1", 4096, 0ms, test::null_logger());
    Scheduler scheduler(source, {}, notifier, options_with_interval(1h), test::null_logger());

    SECTION("Stop before run") {
        scheduler.stop();
        REQUIRE(scheduler.state() == SchedulerState::Stopped);

        scheduler.run();
        REQUIRE(source.calls() == 0);
        REQUIRE_THROWS_AS(scheduler.run(), std::logic_error);

        REQUIRE_NOTHROW(scheduler.stop());
    }

    SECTION("Stop during the wait returns promptly and fetches nothing more") {
        std::thread runner([&scheduler] { scheduler.run(); });

        REQUIRE(test::wait_for([&] { return scheduler.stats().cycles == 1; }));
        REQUIRE(scheduler.state() == SchedulerState::Running);

        auto started = std::chrono::steady_clock::now();
        scheduler.stop();
        auto elapsed = std::chrono::steady_clock::now() - started;
        runner.join();

        REQUIRE(elapsed < 2s);
        REQUIRE(scheduler.state() == SchedulerState::Stopped);
        REQUIRE(source.calls() == 1);

        REQUIRE_THROWS_AS(scheduler.run(), std::logic_error);
        REQUIRE_NOTHROW(scheduler.stop());
    }
}

TEST_CASE("Scheduler stop during a running cycle", "[scheduler]") {
    test::TempDir dir;
    test::FakeTransport transport;
    Notifier notifier(transport, "1", 4096, 0ms, test::null_logger());

    SECTION("Stop waits for the in-flight fetch and starts no other") {
        test::Gate gate;
        test::FakeSource source({test::gated_step(gate, {test::stock_product("p1", 0, 10)})});
        Scheduler scheduler(source, {stock_checker(dir)}, notifier,
                            options_with_interval(10ms), test::null_logger());

        std::thread runner([&scheduler] { scheduler.run(); });
        REQUIRE(test::wait_for([&] { return gate.entered(); }));

        std::atomic<bool> stop_returned{false};
        std::thread stopper([&] {
            scheduler.stop();
            stop_returned = true;
        });

        REQUIRE(test::wait_for([&] { return scheduler.state() == SchedulerState::StopRequested; }));
        std::this_thread::sleep_for(100ms);
        REQUIRE_FALSE(stop_returned);

        gate.open();
        stopper.join();
        runner.join();

        REQUIRE(stop_returned);
        REQUIRE(scheduler.state() == SchedulerState::Stopped);
        REQUIRE(source.calls() == 1);
        // checkers are skipped once the stop is seen
        REQUIRE(transport.sent().empty());
    }

    SECTION("Stop inside a checker skips the rest and delivers what was produced") {
        test::FakeSource source({test::snapshot_step({test::stock_product("p1", 0, 10)})});
        auto stopping = std::make_shared<StoppingChecker>(
            std::make_unique<CacheStore>(dir.file("stopping.json"), test::null_logger()),
            test::null_logger());
        auto counting = std::make_shared<CountingChecker>(
            std::make_unique<CacheStore>(dir.file("counting.json"), test::null_logger()),
            test::null_logger());

        Scheduler scheduler(source, {stock_checker(dir), stopping, counting}, notifier,
                            options_with_interval(10ms), test::null_logger());
        stopping->scheduler = &scheduler;

        std::thread runner([&scheduler] { scheduler.run(); });
        runner.join();
        stopping->stopper.join();

        REQUIRE(scheduler.state() == SchedulerState::Stopped);
        REQUIRE(source.calls() == 1);
        REQUIRE(counting->calls == 0);

        auto sent = transport.sent();
        REQUIRE(sent.size() == 2);
        REQUIRE(sent[0].text.find("Out of stock: Product p1") != std::string::npos);
        REQUIRE(sent[1].text == "Late group\n\nProduced before stop");
        REQUIRE(scheduler.stats().notifications == 2);
    }
}

TEST_CASE("Scheduler recovers from fetch failures", "[scheduler]") {
    test::TempDir dir;
    test::FakeTransport transport;
    Notifier notifier(transport, "1", 4096, 0ms, test::null_logger());

    SECTION("A failed cycle does not block the next one") {
        test::FakeSource source({
            test::failing_step(),
            test::snapshot_step({test::stock_product("p1", 0, 10)})
        });
        Scheduler scheduler(source, {stock_checker(dir)}, notifier,
                            options_with_interval(50ms), test::null_logger());

        std::thread runner([&scheduler] { scheduler.run(); });
        bool recovered = test::wait_for([&] { return scheduler.stats().cycles >= 2; });
        scheduler.stop();
        runner.join();

        REQUIRE(recovered);
        auto stats = scheduler.stats();
        REQUIRE(stats.failed_fetches == 1);
        REQUIRE(stats.last_success_ms > 0);

        auto sent = transport.sent();
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].text.find("Out of stock: Product p1") != std::string::npos);
    }

    SECTION("Retries inside one cycle") {
        test::FakeSource source({
            test::failing_step(),
            test::failing_step(),
            test::snapshot_step({})
        });
        auto options = options_with_interval(1h);
        options.fetch_attempts = 3;
        Scheduler scheduler(source, {stock_checker(dir)}, notifier, options, test::null_logger());

        std::thread runner([&scheduler] { scheduler.run(); });
        bool done = test::wait_for([&] { return scheduler.stats().cycles == 1; });
        scheduler.stop();
        runner.join();

        REQUIRE(done);
        REQUIRE(source.calls() == 3);
        REQUIRE(scheduler.stats().failed_fetches == 0);
    }

    SECTION("Stop interrupts the retry backoff") {
        test::FakeSource source({test::failing_step()});
        auto options = options_with_interval(1h);
        options.fetch_attempts = 3;
        options.retry_delay = 1h;
        Scheduler scheduler(source, {stock_checker(dir)}, notifier, options, test::null_logger());

        std::thread runner([&scheduler] { scheduler.run(); });
        REQUIRE(test::wait_for([&] { return source.calls() == 1; }));

        auto started = std::chrono::steady_clock::now();
        scheduler.stop();
        auto elapsed = std::chrono::steady_clock::now() - started;
        runner.join();

        REQUIRE(elapsed < 2s);
        REQUIRE(source.calls() == 1);
    }
}

TEST_CASE("Scheduler delivery", "[scheduler]") {
    test::TempDir dir;
    test::FakeTransport transport;
    Notifier notifier(transport, "1", 4096, 0ms, test::null_logger());

    SECTION("High priority first, one message per header") {
        const int64_t now = util::current_timestamp_ms();
        test::FakeSource source({test::snapshot_step({
            test::stock_product("low", 3, 8),
            test::stock_product("zero", 0, 10),
            test::expiring_product("old", now - 2 * test::kDay)
        })});
        Scheduler scheduler(source, {stock_checker(dir), expiration_checker(dir)}, notifier,
                            options_with_interval(1h), test::null_logger());

        std::thread runner([&scheduler] { scheduler.run(); });
        bool done = test::wait_for([&] { return scheduler.stats().cycles == 1; });
        scheduler.stop();
        runner.join();

        REQUIRE(done);
        auto sent = transport.sent();
        REQUIRE(sent.size() == 2);

        REQUIRE(sent[0].text.find("STOCK ALERTS") != std::string::npos);
        auto zero_pos = sent[0].text.find("Out of stock: Product zero");
        auto low_pos = sent[0].text.find("Low stock: Product low");
        REQUIRE(zero_pos != std::string::npos);
        REQUIRE(low_pos != std::string::npos);
        REQUIRE(zero_pos < low_pos);

        REQUIRE(sent[1].text.find("EXPIRED: Product old") != std::string::npos);
        REQUIRE(scheduler.stats().notifications == 3);
    }

    SECTION("A throwing checker does not stop the others") {
        test::FakeSource source({test::snapshot_step({test::stock_product("p1", 0, 10)})});
        auto broken = std::make_shared<BrokenChecker>(
            std::make_unique<CacheStore>(dir.file("broken.json"), test::null_logger()),
            test::null_logger());
        Scheduler scheduler(source, {broken, stock_checker(dir)}, notifier,
                            options_with_interval(1h), test::null_logger());

        std::thread runner([&scheduler] { scheduler.run(); });
        bool done = test::wait_for([&] { return scheduler.stats().cycles == 1; });
        scheduler.stop();
        runner.join();

        REQUIRE(done);
        REQUIRE(transport.sent().size() == 1);
    }
}

TEST_CASE("Health reflects the scheduler", "[health]") {
    test::FakeSource source({test::snapshot_step({})});
    test::FakeTransport transport;
    Notifier notifier(transport, "1", 4096, 0ms, test::null_logger());
    Scheduler scheduler(source, {}, notifier, options_with_interval(1h), test::null_logger());
    HealthCheck health(scheduler, "stockwatch");

    REQUIRE_FALSE(health.is_healthy(util::current_timestamp_ms()));

    std::thread runner([&scheduler] { scheduler.run(); });
    REQUIRE(test::wait_for([&] { return scheduler.stats().cycles == 1; }));

    const int64_t now = util::current_timestamp_ms();
    REQUIRE(health.is_healthy(now));
    REQUIRE_FALSE(health.is_healthy(now + 4 * test::kHour));

    auto status = health.get_status(now);
    REQUIRE(status["ok"] == true);
    REQUIRE(status["scheduler"] == "running");
    REQUIRE(status["cycles"] == 1);
    REQUIRE(status["service"] == "stockwatch");

    scheduler.stop();
    runner.join();

    REQUIRE_FALSE(health.is_healthy(util::current_timestamp_ms()));
    REQUIRE(health.get_status(now)["scheduler"] == "stopped");
}
