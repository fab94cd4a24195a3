#pragma once

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

struct CacheRecord {
    int64_t first_seen_ms = 0;
    int64_t last_alerted_ms = 0;
    std::string fingerprint;

    bool operator==(const CacheRecord& other) const {
        return first_seen_ms == other.first_seen_ms &&
               last_alerted_ms == other.last_alerted_ms &&
               fingerprint == other.fingerprint;
    }
};

// Key -> record map mirrored to a JSON file.
//
// Not thread-safe. Each store has a single writer: the checker that owns it
// runs on the scheduler thread, the phone cache on the poller thread.
class CacheStore {
public:
    static constexpr int kFormatVersion = 1;

    CacheStore(std::string path, std::shared_ptr<spdlog::logger> log);

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    std::optional<CacheRecord> get(const std::string& key) const;
    void put(const std::string& key, const CacheRecord& record);
    bool erase(const std::string& key);

    // Replaces the in-memory map with the file contents. A missing,
    // unparsable or wrong-version file leaves the store empty.
    void load();

    // Writes <path>.tmp and renames it over <path>. Returns false on failure.
    bool persist() const;

    // Drops records whose newest timestamp is older than now - retention.
    size_t purge_expired(int64_t now_ms, std::chrono::milliseconds retention);

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    void clear() { records_.clear(); }
    const std::map<std::string, CacheRecord>& records() const { return records_; }
    const std::string& path() const { return path_; }

    static nlohmann::json encode(const std::map<std::string, CacheRecord>& records);
    // Throws CacheCorruptionError
    static std::map<std::string, CacheRecord> decode(const nlohmann::json& doc);

private:
    std::string path_;
    std::shared_ptr<spdlog::logger> log_;
    std::map<std::string, CacheRecord> records_;
};
