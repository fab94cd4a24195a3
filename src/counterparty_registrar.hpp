#pragma once

#include "cache_store.hpp"
#include "inventory_source.hpp"
#include <spdlog/spdlog.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct ImportSummary {
    size_t added = 0;
    size_t skipped = 0;
    std::vector<std::string> failed;
    size_t processed = 0;
    bool aborted = false;
};

// Finds or creates counterparties by normalized phone and remembers every
// known phone in the phone cache. Runs on the poller thread only.
class CounterpartyRegistrar {
public:
    static constexpr size_t kBatchSize = 50;
    static constexpr size_t kMaxFileBytes = 10 * 1024 * 1024;

    // Called after every batch with (processed, total). Returning false
    // stops the import.
    using Progress = std::function<bool(size_t, size_t)>;

    struct Resolution {
        Counterparty counterparty;
        bool created = false;
    };

    CounterpartyRegistrar(CounterpartyDirectory& directory,
                          CacheStore& phone_cache,
                          std::shared_ptr<spdlog::logger> log,
                          size_t batch_size = kBatchSize);

    bool is_known(const std::string& phone) const;
    size_t known_count() const { return phone_cache_.size(); }

    // Throws FetchError. The cache is updated but not persisted.
    Resolution resolve(const std::string& phone);

    // Known phones are skipped, the rest go through resolve(). The cache is
    // persisted after every batch.
    ImportSummary import(const std::vector<std::string>& phones,
                         const Progress& progress = nullptr);

    bool persist();

    // Phone numbers from a CSV or plain text export, normalized and
    // deduplicated in file order. A header row naming a phone column
    // limits the scan to that column.
    static std::vector<std::string> extract_phones(const std::string& content);
    static bool is_supported_file(const std::string& file_name);

private:
    CounterpartyDirectory& directory_;
    CacheStore& phone_cache_;
    std::shared_ptr<spdlog::logger> log_;
    size_t batch_size_;
};
