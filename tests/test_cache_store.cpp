#include <catch2/catch_test_macros.hpp>
#include "../src/cache_store.hpp"
#include "../src/errors.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>

namespace {

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

std::map<std::string, CacheRecord> fill(CacheStore& store, int count) {
    for (int i = 0; i < count; i++) {
        CacheRecord rec;
        rec.first_seen_ms = 1700000000000LL + i;
        rec.last_alerted_ms = 1700000500000LL + i * 7;
        rec.fingerprint = i % 2 == 0 ? "zero" : "low:" + std::to_string(i % 4 + 1);
        store.put("product-" + std::to_string(i), rec);
    }
    return store.records();
}

} // namespace

TEST_CASE("Cache store persists and reloads", "[cache]") {
    test::TempDir dir;
    auto log = test::null_logger();
    const std::string path = dir.file("stocks_cache.json");

    for (int count : {0, 1, 1000}) {
        CacheStore store(path, log);
        auto expected = fill(store, count);
        REQUIRE(store.persist());

        CacheStore reloaded(path, log);
        reloaded.load();
        REQUIRE(reloaded.size() == static_cast<size_t>(count));
        REQUIRE(reloaded.records() == expected);
    }

    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_CASE("Cache store basic operations", "[cache]") {
    test::TempDir dir;
    CacheStore store(dir.file("c.json"), test::null_logger());

    REQUIRE(store.empty());
    REQUIRE_FALSE(store.get("a").has_value());

    store.put("a", CacheRecord{1, 2, "zero"});
    REQUIRE(store.get("a").has_value());
    REQUIRE(store.get("a")->fingerprint == "zero");

    store.put("a", CacheRecord{1, 5, "low:2"});
    REQUIRE(store.size() == 1);
    REQUIRE(store.get("a")->last_alerted_ms == 5);

    REQUIRE(store.erase("a"));
    REQUIRE_FALSE(store.erase("a"));
    REQUIRE(store.empty());
}

TEST_CASE("Cache store recovers from bad files", "[cache]") {
    test::TempDir dir;
    auto log = test::null_logger();
    const std::string path = dir.file("expiration_cache.json");

    SECTION("Missing file") {
        CacheStore store(path, log);
        store.put("stale", CacheRecord{1, 1, "x"});
        store.load();
        REQUIRE(store.empty());
    }

    SECTION("Unparsable file") {
        write_file(path, "{ not json");
        CacheStore store(path, log);
        store.load();
        REQUIRE(store.empty());
    }

    SECTION("Wrong format version") {
        write_file(path, R"({"version": 99, "records": []})");
        CacheStore store(path, log);
        store.load();
        REQUIRE(store.empty());
    }

    SECTION("Malformed record") {
        write_file(path, R"({"version": 1, "records": [{"key": "a", "first_seen": "yesterday"}]})");
        CacheStore store(path, log);
        store.load();
        REQUIRE(store.empty());
    }

    SECTION("Corrupt file is replaced on persist") {
        write_file(path, "garbage");
        CacheStore store(path, log);
        store.load();
        store.put("a", CacheRecord{1, 2, "zero"});
        REQUIRE(store.persist());

        CacheStore reloaded(path, log);
        reloaded.load();
        REQUIRE(reloaded.size() == 1);
    }
}

TEST_CASE("Cache decoding rejects invalid documents", "[cache]") {
    const nlohmann::json not_object = nlohmann::json::array();
    const nlohmann::json no_records = {{"version", 1}};
    const nlohmann::json future_version = {{"version", 2}, {"records", nlohmann::json::array()}};

    REQUIRE_THROWS_AS(CacheStore::decode(not_object), CacheCorruptionError);
    REQUIRE_THROWS_AS(CacheStore::decode(no_records), CacheCorruptionError);
    REQUIRE_THROWS_AS(CacheStore::decode(future_version), CacheCorruptionError);

    auto doc = CacheStore::encode({{"k", CacheRecord{10, 20, "zero"}}});
    REQUIRE(doc["version"] == CacheStore::kFormatVersion);
    auto records = CacheStore::decode(doc);
    REQUIRE(records.at("k") == CacheRecord{10, 20, "zero"});
}

TEST_CASE("Cache store purges stale records", "[cache]") {
    test::TempDir dir;
    CacheStore store(dir.file("c.json"), test::null_logger());

    const int64_t now = 1714521600000LL;
    const auto retention = std::chrono::hours(24 * 30);

    store.put("old", CacheRecord{now - 40 * test::kDay, now - 31 * test::kDay, "zero"});
    store.put("realerted", CacheRecord{now - 40 * test::kDay, now - 2 * test::kDay, "zero"});
    store.put("fresh", CacheRecord{now - test::kDay, now - test::kDay, "low:1"});

    REQUIRE(store.purge_expired(now, retention) == 1);
    REQUIRE_FALSE(store.get("old").has_value());
    REQUIRE(store.get("realerted").has_value());
    REQUIRE(store.get("fresh").has_value());

    REQUIRE(store.purge_expired(now, retention) == 0);
}

TEST_CASE("Cache store reports persist failures", "[cache]") {
    test::TempDir dir;
    const std::string blocker = dir.file("blocker");
    write_file(blocker, "a regular file");

    CacheStore store(blocker + "/cache.json", test::null_logger());
    store.put("a", CacheRecord{1, 2, "zero"});
    REQUIRE_FALSE(store.persist());
}

TEST_CASE("Cache store syncs into a fresh directory", "[cache]") {
    test::TempDir dir;
    auto log = test::null_logger();
    const std::string path = dir.file("data/cache/phones.json");

    CacheStore store(path, log);
    store.put("291234567", CacheRecord{10, 10, "cp-1"});
    REQUIRE(store.persist());

    store.put("291234567", CacheRecord{10, 20, "cp-2"});
    REQUIRE(store.persist());

    CacheStore reloaded(path, log);
    reloaded.load();
    REQUIRE(reloaded.get("291234567") == std::optional<CacheRecord>(CacheRecord{10, 20, "cp-2"}));
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));
}
