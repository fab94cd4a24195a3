#include "stock_checker.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

StockChecker::StockChecker(std::unique_ptr<CacheStore> cache,
                           int buckets,
                           std::chrono::milliseconds suppression,
                           std::shared_ptr<spdlog::logger> log)
    : Checker(std::move(cache), suppression, std::move(log))
    , buckets_(std::max(1, buckets))
{}

std::string StockChecker::fingerprint(double stock, double min_balance) const {
    if (stock <= 0) {
        return "zero";
    }
    int bucket = static_cast<int>(std::ceil(stock / min_balance * buckets_));
    bucket = std::clamp(bucket, 1, buckets_);
    return "low:" + std::to_string(bucket);
}

std::vector<Notification> StockChecker::check(const DomainSnapshot& snapshot) {
    std::vector<Notification> alerts;
    const int64_t now_ms = snapshot.fetched_at_ms;

    int processed = 0;
    int skipped = 0;
    int zero_stock = 0;
    int below_min = 0;

    for (const auto& product : snapshot.products) {
        if (!product.needs_stock_check()) continue;

        if (product.id.empty() || !std::isfinite(product.stock) ||
            !std::isfinite(*product.min_balance)) {
            log_->warn("[stock] skipping malformed product '{}' (id '{}')",
                       product.name, product.id);
            skipped++;
            continue;
        }

        processed++;
        const double min_balance = *product.min_balance;

        log_->debug("[stock] {} ({}): stock={}, min={}",
                    product.name, product.id, product.stock, min_balance);

        if (product.stock > min_balance) {
            clear_condition(product.id);
            continue;
        }

        bool zero = product.stock <= 0;
        if (zero) {
            zero_stock++;
        } else {
            below_min++;
        }

        std::string fp = fingerprint(product.stock, min_balance);
        AlertDecision decision = decide(product.id, fp, now_ms);
        if (decision == AlertDecision::None) continue;

        alerts.push_back(build_alert(product, zero, decision, now_ms));
        record_alert(product.id, fp, now_ms);
        log_->info("[stock] {} for {} ({})",
                   zero ? "zero stock" : "below minimum", product.name, product.id);
    }

    persist_cache();

    log_->info("[stock] check complete: products={}, alerts={}, zero={}, below_min={}, skipped={}",
               processed, alerts.size(), zero_stock, below_min, skipped);
    return alerts;
}

Notification StockChecker::build_alert(const Product& product, bool zero,
                                       AlertDecision decision, int64_t now_ms) const {
    Notification n;
    n.channel = name();
    n.header = fmt::format("📊 <b>STOCK ALERTS</b> ({})", util::html_escape(product.group_path));
    n.priority = zero ? Priority::High : Priority::Normal;

    std::string title = zero
        ? fmt::format("🛑 <b>Out of stock: {}</b>", util::html_escape(product.name))
        : fmt::format("⚠️ <b>Low stock: {}</b>", util::html_escape(product.name));

    n.text = fmt::format("{}\n▸ Stock: {:g} (minimum: {:g})\n▸ {}",
                         title, product.stock, *product.min_balance,
                         util::format_datetime(now_ms));

    if (decision == AlertDecision::Reminder) {
        auto cached = cache_->get(product.id);
        if (cached) {
            n.text += fmt::format("\n▸ Reminder: unresolved since {}",
                                  util::format_date(cached->first_seen_ms));
        }
        n.priority = Priority::Low;
    }
    return n;
}
