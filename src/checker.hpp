#pragma once

#include "cache_store.hpp"
#include "types.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

enum class AlertDecision {
    None,       // known condition, inside the suppression window
    New,        // no record for the entity
    Changed,    // fingerprint differs from the stored one
    Reminder    // unchanged, but last alert is older than the suppression window
};

// A condition evaluated against every snapshot. The checker is the only
// writer of its cache and persists it at the end of each check().
class Checker {
public:
    Checker(std::unique_ptr<CacheStore> cache,
            std::chrono::milliseconds suppression,
            std::shared_ptr<spdlog::logger> log);
    virtual ~Checker() = default;

    Checker(const Checker&) = delete;
    Checker& operator=(const Checker&) = delete;

    virtual std::string name() const = 0;
    virtual std::vector<Notification> check(const DomainSnapshot& snapshot) = 0;

    size_t purge_expired(int64_t now_ms, std::chrono::milliseconds retention);

    const CacheStore& cache() const { return *cache_; }

protected:
    AlertDecision decide(const std::string& key, const std::string& fingerprint,
                         int64_t now_ms) const;
    void record_alert(const std::string& key, const std::string& fingerprint, int64_t now_ms);
    void clear_condition(const std::string& key);
    void persist_cache();

    std::unique_ptr<CacheStore> cache_;
    std::chrono::milliseconds suppression_;
    std::shared_ptr<spdlog::logger> log_;
};
