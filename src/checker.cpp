#include "checker.hpp"

Checker::Checker(std::unique_ptr<CacheStore> cache,
                 std::chrono::milliseconds suppression,
                 std::shared_ptr<spdlog::logger> log)
    : cache_(std::move(cache))
    , suppression_(suppression)
    , log_(std::move(log))
{}

AlertDecision Checker::decide(const std::string& key, const std::string& fingerprint,
                              int64_t now_ms) const {
    auto cached = cache_->get(key);
    if (!cached) {
        return AlertDecision::New;
    }
    if (cached->fingerprint != fingerprint) {
        return AlertDecision::Changed;
    }
    // A zero window disables reminders
    if (suppression_.count() > 0 &&
        now_ms - cached->last_alerted_ms >= suppression_.count()) {
        return AlertDecision::Reminder;
    }
    return AlertDecision::None;
}

void Checker::record_alert(const std::string& key, const std::string& fingerprint,
                           int64_t now_ms) {
    CacheRecord rec;
    auto cached = cache_->get(key);
    rec.first_seen_ms = cached ? cached->first_seen_ms : now_ms;
    rec.last_alerted_ms = now_ms;
    rec.fingerprint = fingerprint;
    cache_->put(key, rec);
}

void Checker::clear_condition(const std::string& key) {
    if (cache_->erase(key)) {
        log_->debug("[{}] condition cleared for {}", name(), key);
    }
}

void Checker::persist_cache() {
    if (!cache_->persist()) {
        log_->error("[{}] cache not persisted, alerts may repeat after restart", name());
    }
}

size_t Checker::purge_expired(int64_t now_ms, std::chrono::milliseconds retention) {
    size_t removed = cache_->purge_expired(now_ms, retention);
    if (removed > 0) {
        persist_cache();
    }
    return removed;
}
