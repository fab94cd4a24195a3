#pragma once

#include "checker.hpp"

enum class ExpirationState {
    Fresh,      // outside the alert window
    Soon,       // critical_days < days <= alert_days
    Critical,   // 0 <= days <= critical_days
    Expired     // days < 0
};

// Alerts on products expiring within alert_days, and always on expired ones.
// The fingerprint carries the expiration date, so a new date re-alerts.
class ExpirationChecker : public Checker {
public:
    ExpirationChecker(std::unique_ptr<CacheStore> cache,
                      int alert_days,
                      int critical_days,
                      std::chrono::milliseconds suppression,
                      std::shared_ptr<spdlog::logger> log);

    std::string name() const override { return "expiration"; }
    std::vector<Notification> check(const DomainSnapshot& snapshot) override;

    ExpirationState classify(int64_t days_left) const;
    static std::string fingerprint(int64_t expiration_ms, ExpirationState state);

private:
    int alert_days_;
    int critical_days_;

    Notification build_alert(const Product& product, ExpirationState state,
                             int64_t days_left, AlertDecision decision) const;
};
