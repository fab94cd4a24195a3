#pragma once

#include "checker.hpp"

// Alerts on products whose stock fell to or below their minimum balance.
// Fingerprints: "zero", or "low:<n>" where n quantizes stock / minimum
// into `buckets` steps.
class StockChecker : public Checker {
public:
    StockChecker(std::unique_ptr<CacheStore> cache,
                 int buckets,
                 std::chrono::milliseconds suppression,
                 std::shared_ptr<spdlog::logger> log);

    std::string name() const override { return "stock"; }
    std::vector<Notification> check(const DomainSnapshot& snapshot) override;

    std::string fingerprint(double stock, double min_balance) const;

private:
    int buckets_;

    Notification build_alert(const Product& product, bool zero,
                             AlertDecision decision, int64_t now_ms) const;
};
