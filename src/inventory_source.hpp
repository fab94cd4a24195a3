#pragma once

#include "types.hpp"
#include <optional>
#include <string>

// Produces the snapshot a scheduler cycle checks against.
class InventorySource {
public:
    virtual ~InventorySource() = default;

    // Throws FetchError. Must return within the client's own timeout.
    virtual DomainSnapshot fetch_snapshot() = 0;
};

// Phone -> counterparty resolution for the interactive poller.
class CounterpartyDirectory {
public:
    virtual ~CounterpartyDirectory() = default;

    // Both throw FetchError on transport or API failures.
    virtual std::optional<Counterparty> find_counterparty(const std::string& phone) = 0;
    virtual Counterparty create_counterparty(const std::string& phone) = 0;

    virtual bool check_connection() = 0;
};
