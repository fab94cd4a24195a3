#include <catch2/catch_test_macros.hpp>
#include "../src/counterparty_registrar.hpp"
#include "../src/errors.hpp"
#include "test_support.hpp"
#include <set>

namespace {

class FakeDirectory : public CounterpartyDirectory {
public:
    std::set<std::string> existing;
    std::set<std::string> broken;
    std::vector<std::string> created;
    int finds = 0;

    std::optional<Counterparty> find_counterparty(const std::string& phone) override {
        finds++;
        if (broken.count(phone)) throw FetchError("HTTP 500");
        if (!existing.count(phone)) return std::nullopt;
        return Counterparty{"cp-" + phone, phone, "+375" + phone, "individual"};
    }

    Counterparty create_counterparty(const std::string& phone) override {
        created.push_back(phone);
        existing.insert(phone);
        return Counterparty{"new-" + phone, phone, "+375" + phone, "individual"};
    }

    bool check_connection() override { return true; }
};

} // namespace

TEST_CASE("Phone list extraction", "[registrar]") {
    SECTION("Header column is used and other columns ignored") {
        std::string csv =
            "\xEF\xBB\xBF" "Наименование;Комментарий\r\n"
            "+375 29 123-45-67;call 80291111111\r\n"
            "\"80 33 765 43 21\";\r\n"
            "\r\n"
            "+375291234567;duplicate\r\n"
            "not a phone;x\r\n";

        auto phones = CounterpartyRegistrar::extract_phones(csv);
        REQUIRE(phones == std::vector<std::string>{"291234567", "337654321"});
    }

    SECTION("Without a header every cell is scanned") {
        std::string text = "+79161234567\n80291234567, 89031234567\n";
        auto phones = CounterpartyRegistrar::extract_phones(text);
        REQUIRE(phones == std::vector<std::string>{"9161234567", "291234567", "9031234567"});
    }

    SECTION("Nothing usable") {
        REQUIRE(CounterpartyRegistrar::extract_phones("").empty());
        REQUIRE(CounterpartyRegistrar::extract_phones("name\nbob\n").empty());
    }

    SECTION("Supported files") {
        REQUIRE(CounterpartyRegistrar::is_supported_file("clients.csv"));
        REQUIRE(CounterpartyRegistrar::is_supported_file("CLIENTS.TXT"));
        REQUIRE_FALSE(CounterpartyRegistrar::is_supported_file("clients.xlsx"));
        REQUIRE_FALSE(CounterpartyRegistrar::is_supported_file("csv"));
    }
}

TEST_CASE("Batch import tallies", "[registrar]") {
    test::TempDir dir;
    auto log = test::null_logger();
    const std::string path = dir.file("phones.json");

    CacheStore cache(path, log);
    cache.put("291111111", CacheRecord{1, 1, "cp-cached"});

    FakeDirectory directory;
    directory.existing = {"292222222"};
    directory.broken = {"293333333"};

    CounterpartyRegistrar registrar(directory, cache, log, 2);

    const std::vector<std::string> phones = {
        "291111111",   // already cached
        "292222222",   // already in MoySklad
        "294444444",
        "293333333",   // API error
        "295555555"
    };

    std::vector<std::pair<size_t, size_t>> progress;

    SECTION("Every number is accounted for") {
        auto summary = registrar.import(phones, [&](size_t done, size_t total) {
            progress.emplace_back(done, total);
            return true;
        });

        REQUIRE(summary.added == 2);
        REQUIRE(summary.skipped == 2);
        REQUIRE(summary.failed == std::vector<std::string>{"293333333"});
        REQUIRE(summary.processed == 5);
        REQUIRE_FALSE(summary.aborted);

        REQUIRE(directory.created == std::vector<std::string>{"294444444", "295555555"});
        REQUIRE(directory.finds == 4);

        REQUIRE(progress == std::vector<std::pair<size_t, size_t>>{{2, 5}, {4, 5}, {5, 5}});

        CacheStore reloaded(path, log);
        reloaded.load();
        REQUIRE(reloaded.size() == 4);
        REQUIRE(reloaded.get("292222222")->fingerprint == "cp-292222222");
        REQUIRE(reloaded.get("294444444")->fingerprint == "new-294444444");
        REQUIRE_FALSE(reloaded.get("293333333").has_value());
    }

    SECTION("A second run skips everything that succeeded") {
        registrar.import(phones);
        directory.broken.clear();

        auto again = registrar.import(phones);
        REQUIRE(again.added == 1);
        REQUIRE(again.skipped == 4);
        REQUIRE(again.failed.empty());
    }

    SECTION("Progress can stop the import between batches") {
        auto summary = registrar.import(phones, [](size_t, size_t) { return false; });

        REQUIRE(summary.aborted);
        REQUIRE(summary.processed == 2);
        REQUIRE(summary.skipped == 2);
        REQUIRE(directory.created.empty());
    }
}

TEST_CASE("Single phone resolution", "[registrar]") {
    test::TempDir dir;
    auto log = test::null_logger();
    CacheStore cache(dir.file("phones.json"), log);
    FakeDirectory directory;
    CounterpartyRegistrar registrar(directory, cache, log);

    auto first = registrar.resolve("291234567");
    REQUIRE(first.created);
    REQUIRE(registrar.is_known("291234567"));
    REQUIRE(registrar.known_count() == 1);

    directory.broken = {"297777777"};
    REQUIRE_THROWS_AS(registrar.resolve("297777777"), FetchError);
    REQUIRE_FALSE(registrar.is_known("297777777"));
}
