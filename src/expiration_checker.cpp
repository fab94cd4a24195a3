#include "expiration_checker.hpp"
#include "util.hpp"
#include <fmt/format.h>

ExpirationChecker::ExpirationChecker(std::unique_ptr<CacheStore> cache,
                                     int alert_days,
                                     int critical_days,
                                     std::chrono::milliseconds suppression,
                                     std::shared_ptr<spdlog::logger> log)
    : Checker(std::move(cache), suppression, std::move(log))
    , alert_days_(alert_days)
    , critical_days_(critical_days)
{}

ExpirationState ExpirationChecker::classify(int64_t days_left) const {
    if (days_left < 0) return ExpirationState::Expired;
    if (days_left > alert_days_) return ExpirationState::Fresh;
    if (days_left <= critical_days_) return ExpirationState::Critical;
    return ExpirationState::Soon;
}

std::string ExpirationChecker::fingerprint(int64_t expiration_ms, ExpirationState state) {
    const char* bucket = "fresh";
    switch (state) {
        case ExpirationState::Soon: bucket = "soon"; break;
        case ExpirationState::Critical: bucket = "critical"; break;
        case ExpirationState::Expired: bucket = "expired"; break;
        case ExpirationState::Fresh: break;
    }
    return util::format_iso_date(expiration_ms) + "|" + bucket;
}

std::vector<Notification> ExpirationChecker::check(const DomainSnapshot& snapshot) {
    std::vector<Notification> alerts;
    const int64_t now_ms = snapshot.fetched_at_ms;

    int processed = 0;
    int skipped = 0;
    int expired = 0;
    int expiring = 0;

    for (const auto& product : snapshot.products) {
        if (!product.needs_expiration_check()) continue;

        if (product.id.empty()) {
            log_->warn("[expiration] skipping product '{}' without id", product.name);
            skipped++;
            continue;
        }

        processed++;
        int64_t days_left = util::days_until(*product.expiration_ms, now_ms);
        ExpirationState state = classify(days_left);

        if (state == ExpirationState::Fresh) {
            clear_condition(product.id);
            continue;
        }

        if (state == ExpirationState::Expired) {
            expired++;
        } else {
            expiring++;
        }

        std::string fp = fingerprint(*product.expiration_ms, state);
        AlertDecision decision = decide(product.id, fp, now_ms);
        if (decision == AlertDecision::None) continue;

        alerts.push_back(build_alert(product, state, days_left, decision));
        record_alert(product.id, fp, now_ms);
        log_->info("[expiration] {} ({}): {} days left", product.name, product.id, days_left);
    }

    persist_cache();

    log_->info("[expiration] check complete: products={}, alerts={}, expired={}, expiring={}, skipped={}",
               processed, alerts.size(), expired, expiring, skipped);
    return alerts;
}

Notification ExpirationChecker::build_alert(const Product& product, ExpirationState state,
                                            int64_t days_left, AlertDecision decision) const {
    Notification n;
    n.channel = name();
    n.header = fmt::format("⏳ <b>EXPIRATION ALERTS</b> ({})", util::html_escape(product.group_path));

    const std::string product_name = util::html_escape(product.name);
    const std::string date = util::format_date(*product.expiration_ms);

    if (state == ExpirationState::Expired) {
        n.priority = Priority::High;
        n.text = fmt::format("🚨 <b>EXPIRED: {}</b>\n▸ Expired on: {}", product_name, date);
    } else {
        n.priority = Priority::Normal;
        const char* emoji = state == ExpirationState::Critical ? "🔴" : "🟡";
        n.text = fmt::format("{} <b>EXPIRING: {}</b>\n▸ Expires: {}\n▸ Days left: {}",
                             emoji, product_name, date, days_left);
    }

    if (decision == AlertDecision::Reminder) {
        n.priority = Priority::Low;
        n.text += "\n▸ Reminder";
    }
    return n;
}
