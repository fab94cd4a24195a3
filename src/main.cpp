#include "auth.hpp"
#include "cache_store.hpp"
#include "config.hpp"
#include "counterparty_registrar.hpp"
#include "errors.hpp"
#include "expiration_checker.hpp"
#include "health.hpp"
#include "health_server.hpp"
#include "http_session.hpp"
#include "logging.hpp"
#include "moysklad_client.hpp"
#include "notifier.hpp"
#include "poller.hpp"
#include "scheduler.hpp"
#include "stock_checker.hpp"
#include "telegram_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

namespace {

std::unique_ptr<CacheStore> open_cache(const Config& config, const std::string& file,
                                       const std::shared_ptr<spdlog::logger>& log) {
    auto cache = std::make_unique<CacheStore>(config.cache_dir() + "/" + file, log);
    cache->load();

    auto retention = std::chrono::hours(24) * config.cache_reset_days;
    size_t removed = cache->purge_expired(util::current_timestamp_ms(), retention);
    if (removed > 0) {
        log->info("Purged {} stale records from {}", removed, file);
        if (!cache->persist()) {
            log->error("Failed to persist {} after purge", file);
        }
    }
    return cache;
}

} // namespace

int main() {
    std::shared_ptr<spdlog::logger> log;

    try {
        auto config = Config::from_env();

        log = setup_logging(config.log_level, config.logs_dir(), config.log_reset_days);

        log->info("==============================================");
        log->info("Stockwatch inventory monitor v1.0");
        log->info("==============================================");

        config.validate();

        std::error_code ec;
        std::filesystem::create_directories(config.cache_dir(), ec);
        if (ec) {
            throw SetupError("Cannot create cache directory " + config.cache_dir() +
                             ": " + ec.message());
        }

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Outlives every HTTP client below
        HttpSession http_session;

        TelegramClient tg_client(config.tg_bot_token, config.request_timeout_seconds);
        auto me = tg_client.get_me();
        if (!me.value("ok", false)) {
            throw SetupError("Telegram rejected the bot token: " +
                             me.value("description", std::string("unknown error")));
        }
        log->info("Telegram bot: @{}", me["result"].value("username", std::string("?")));

        MoyskladOptions ms_options;
        ms_options.base_url = config.ms_base_url;
        ms_options.token = config.ms_token;
        ms_options.page_limit = config.api_page_limit;
        ms_options.timeout_seconds = config.request_timeout_seconds;
        ms_options.expiration_attribute = config.expiration_attribute;
        MoyskladClient moysklad(ms_options, log);

        if (!moysklad.check_connection()) {
            log->warn("MoySklad API is not reachable yet, the scheduler will retry");
        }

        auto suppression = std::chrono::hours(config.suppression_hours);

        std::vector<std::shared_ptr<Checker>> checkers;
        checkers.push_back(std::make_shared<StockChecker>(
            open_cache(config, "stocks_cache.json", log),
            config.stock_buckets, suppression, log));
        checkers.push_back(std::make_shared<ExpirationChecker>(
            open_cache(config, "expiration_cache.json", log),
            config.alert_days, config.expiration_critical_days, suppression, log));

        auto phone_cache = open_cache(config, "phones.json", log);

        Notifier notifier(tg_client, config.chat_id,
                          static_cast<size_t>(config.tg_message_limit),
                          std::chrono::milliseconds(config.tg_chunk_delay_ms), log);

        SchedulerOptions options;
        options.interval = std::chrono::minutes(config.check_interval_minutes);
        options.fetch_attempts = config.fetch_attempts;
        options.retry_delay = std::chrono::seconds(config.fetch_retry_delay_seconds);
        options.purge_every_cycles = config.cache_purge_every_cycles;
        options.cache_retention = std::chrono::hours(24) * config.cache_reset_days;

        Scheduler scheduler(moysklad, checkers, notifier, options, log);

        Authenticator auth(config);
        HealthCheck health(scheduler, config.service_name);

        if (!tg_client.delete_webhook()) {
            log->warn("deleteWebhook failed, polling may be rejected");
        }
        CounterpartyRegistrar registrar(moysklad, *phone_cache, log);
        TelegramPoller poller(tg_client, moysklad, registrar, auth, scheduler, config, log);
        HealthServer health_server(health, config.listen_addr, config.listen_port);

        std::thread scheduler_thread([&scheduler, &log]() {
            try {
                scheduler.run();
            } catch (const std::exception& e) {
                log->critical("Scheduler terminated: {}", e.what());
                shutdown_requested = true;
            }
        });

        poller.start();
        health_server.start();

        notifier.send(fmt::format("🟢 <b>{}</b> started. Checking every {} min.",
                                  util::html_escape(config.service_name),
                                  config.check_interval_minutes));

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        log->info("Shutdown requested");

        scheduler.stop();
        if (scheduler_thread.joinable()) {
            scheduler_thread.join();
        }
        poller.stop();
        health_server.stop();

        log->info("Shutdown complete");
        return 0;

    } catch (const SetupError& e) {
        if (log) {
            log->critical("Setup failed: {}", e.what());
        } else {
            spdlog::critical("Setup failed: {}", e.what());
        }
        return 1;
    } catch (const std::exception& e) {
        if (log) {
            log->critical("Fatal error: {}", e.what());
        } else {
            spdlog::critical("Fatal error: {}", e.what());
        }
        return 1;
    }
}
