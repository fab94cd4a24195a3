#pragma once

#include "assortment.hpp"
#include "http_session.hpp"
#include "inventory_source.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>

struct MoyskladOptions {
    std::string base_url = "https://api.moysklad.ru/api/remap/1.2";
    std::string token;
    int page_limit = 500;
    long timeout_seconds = 30;
    std::string expiration_attribute = "Срок годности";
    std::chrono::milliseconds page_delay{1000};
};

// Blocking MoySklad client. No retries here: the scheduler owns the retry
// policy. Thread-safe, every request uses its own curl handle.
class MoyskladClient : public InventorySource, public CounterpartyDirectory {
public:
    MoyskladClient(MoyskladOptions options, std::shared_ptr<spdlog::logger> log);

    MoyskladClient(const MoyskladClient&) = delete;
    MoyskladClient& operator=(const MoyskladClient&) = delete;

    DomainSnapshot fetch_snapshot() override;

    std::optional<Counterparty> find_counterparty(const std::string& phone) override;
    Counterparty create_counterparty(const std::string& phone) override;
    bool check_connection() override;

private:
    struct Response {
        long status = 0;
        nlohmann::json body;
    };

    MoyskladOptions options_;
    std::shared_ptr<spdlog::logger> log_;

    FolderMap fetch_folders();

    // Calls on_page for each page until a short page is returned.
    template <typename OnPage>
    void fetch_paged(const std::string& path,
                     const std::map<std::string, std::string>& params,
                     OnPage on_page);

    // Throws FetchError on transport failures, unparsable bodies and, unless
    // the status is listed in `accepted`, on HTTP errors.
    Response request(const std::string& method,
                     const std::string& path,
                     const std::map<std::string, std::string>& params,
                     const nlohmann::json& body = nullptr,
                     std::initializer_list<long> accepted = {});

    std::string build_url(CURL* curl, const std::string& path,
                          const std::map<std::string, std::string>& params) const;
};
