#include "cache_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Flushes a file or directory to disk. A directory is synced so a rename
// inside it survives a crash.
void sync_path(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + path);
    }
    int rc = ::fsync(fd);
    int saved = errno;
    ::close(fd);
    if (rc != 0) {
        throw std::system_error(saved, std::generic_category(), "fsync " + path);
    }
}

} // namespace

CacheStore::CacheStore(std::string path, std::shared_ptr<spdlog::logger> log)
    : path_(std::move(path))
    , log_(std::move(log))
{}

std::optional<CacheRecord> CacheStore::get(const std::string& key) const {
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

void CacheStore::put(const std::string& key, const CacheRecord& record) {
    records_[key] = record;
}

bool CacheStore::erase(const std::string& key) {
    return records_.erase(key) > 0;
}

nlohmann::json CacheStore::encode(const std::map<std::string, CacheRecord>& records) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& [key, rec] : records) {
        items.push_back({
            {"key", key},
            {"first_seen", rec.first_seen_ms},
            {"last_alerted", rec.last_alerted_ms},
            {"fingerprint", rec.fingerprint}
        });
    }
    return nlohmann::json{
        {"version", kFormatVersion},
        {"records", items}
    };
}

std::map<std::string, CacheRecord> CacheStore::decode(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw CacheCorruptionError("top level is not an object");
    }
    if (!doc.contains("version") || !doc["version"].is_number_integer() ||
        doc["version"].get<int>() != kFormatVersion) {
        throw CacheCorruptionError("unsupported cache format version");
    }
    if (!doc.contains("records") || !doc["records"].is_array()) {
        throw CacheCorruptionError("missing records array");
    }

    std::map<std::string, CacheRecord> records;
    for (const auto& item : doc["records"]) {
        try {
            CacheRecord rec;
            rec.first_seen_ms = item.at("first_seen").get<int64_t>();
            rec.last_alerted_ms = item.at("last_alerted").get<int64_t>();
            rec.fingerprint = item.at("fingerprint").get<std::string>();
            records[item.at("key").get<std::string>()] = rec;
        } catch (const nlohmann::json::exception& e) {
            throw CacheCorruptionError(std::string("bad record: ") + e.what());
        }
    }
    return records;
}

void CacheStore::load() {
    records_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        log_->info("Cache {} not found, starting empty", path_);
        return;
    }

    try {
        std::ifstream in(path_);
        if (!in) {
            throw CacheCorruptionError("cannot open file");
        }
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(in);
        } catch (const nlohmann::json::parse_error& e) {
            throw CacheCorruptionError(e.what());
        }
        records_ = decode(doc);
        log_->debug("Loaded {} cache records from {}", records_.size(), path_);
    } catch (const CacheCorruptionError& e) {
        log_->warn("Cache {} is unreadable, starting empty: {}", path_, e.what());
        records_.clear();
    }
}

bool CacheStore::persist() const {
    const std::string tmp_path = path_ + ".tmp";

    try {
        fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out) {
                throw std::runtime_error("cannot open " + tmp_path + " for writing");
            }
            out << encode(records_).dump(2);
            out.flush();
            if (!out) {
                throw std::runtime_error("short write to " + tmp_path);
            }
        }

        sync_path(tmp_path, O_RDONLY);
        fs::rename(tmp_path, path_);
        sync_path(parent.empty() ? std::string(".") : parent.string(), O_RDONLY | O_DIRECTORY);
        return true;

    } catch (const std::exception& e) {
        log_->error("Failed to persist cache {}: {}", path_, e.what());
        std::error_code ec;
        fs::remove(tmp_path, ec);
        return false;
    }
}

size_t CacheStore::purge_expired(int64_t now_ms, std::chrono::milliseconds retention) {
    int64_t cutoff_ms = now_ms - retention.count();
    size_t removed = 0;

    for (auto it = records_.begin(); it != records_.end();) {
        int64_t newest = std::max(it->second.first_seen_ms, it->second.last_alerted_ms);
        if (newest < cutoff_ms) {
            it = records_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        log_->info("Purged {} expired records from {}", removed, path_);
    }
    return removed;
}
