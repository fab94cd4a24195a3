#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

struct Product {
    std::string id;
    std::string name;
    double stock = 0.0;
    std::optional<double> min_balance;
    std::string group_path;
    std::optional<int64_t> expiration_ms;

    bool needs_stock_check() const { return min_balance.has_value() && *min_balance > 0; }
    bool needs_expiration_check() const { return expiration_ms.has_value(); }
};

struct DomainSnapshot {
    std::vector<Product> products;
    int64_t fetched_at_ms = 0;
};

enum class Priority {
    Low,      // periodic reminder of an unchanged condition
    Normal,
    High
};

struct Notification {
    std::string channel;
    std::string header;
    std::string text;
    Priority priority = Priority::Normal;
};

struct Counterparty {
    std::string id;
    std::string name;
    std::string phone;
    std::string company_type;
};
