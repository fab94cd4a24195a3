#include "moysklad_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <thread>

MoyskladClient::MoyskladClient(MoyskladOptions options, std::shared_ptr<spdlog::logger> log)
    : options_(std::move(options))
    , log_(std::move(log))
{
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }
}

std::string MoyskladClient::build_url(CURL* curl, const std::string& path,
                                      const std::map<std::string, std::string>& params) const {
    std::string url = options_.base_url + "/" + path;
    char sep = '?';
    for (const auto& [key, value] : params) {
        char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        if (!escaped) {
            throw FetchError("Failed to encode query parameter " + key);
        }
        url += sep;
        url += key + "=" + escaped;
        curl_free(escaped);
        sep = '&';
    }
    return url;
}

MoyskladClient::Response MoyskladClient::request(const std::string& method,
                                                 const std::string& path,
                                                 const std::map<std::string, std::string>& params,
                                                 const nlohmann::json& body,
                                                 std::initializer_list<long> accepted) {
    CurlHandle curl;
    try {
        curl = http::make_handle(options_.timeout_seconds);
    } catch (const std::runtime_error& e) {
        throw FetchError(e.what());
    }

    std::string url = build_url(curl.get(), path, params);
    std::string response_string;
    std::string payload;

    CurlHeaders headers(curl_slist_append(nullptr,
        ("Authorization: Bearer " + options_.token).c_str()));
    headers.reset(curl_slist_append(headers.release(), "Accept: application/json;charset=utf-8"));

    if (method == "POST") {
        payload = body.is_null() ? "{}" : body.dump();
        headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw FetchError(fmt::format("{} {} failed: {}", method, path, curl_easy_strerror(res)));
    }

    Response response;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    bool accepted_status = std::find(accepted.begin(), accepted.end(), response.status)
                           != accepted.end();
    if (response.status >= 400 && !accepted_status) {
        throw FetchError(fmt::format("{} {} returned HTTP {}: {}", method, path,
                                     response.status, response_string.substr(0, 300)));
    }

    if (!response_string.empty()) {
        try {
            response.body = nlohmann::json::parse(response_string);
        } catch (const nlohmann::json::parse_error& e) {
            throw FetchError(fmt::format("{} {} returned invalid JSON: {}", method, path, e.what()));
        }
    }

    return response;
}

template <typename OnPage>
void MoyskladClient::fetch_paged(const std::string& path,
                                 const std::map<std::string, std::string>& params,
                                 OnPage on_page) {
    int offset = 0;
    while (true) {
        auto page_params = params;
        page_params["limit"] = std::to_string(options_.page_limit);
        page_params["offset"] = std::to_string(offset);

        auto response = request("GET", path, page_params);
        const auto& page = response.body;
        if (!page.contains("rows") || !page["rows"].is_array()) {
            throw FetchError(path + " response has no rows");
        }

        on_page(page);

        int rows = static_cast<int>(page["rows"].size());
        if (rows < options_.page_limit) break;

        offset += rows;
        std::this_thread::sleep_for(options_.page_delay);
    }
}

FolderMap MoyskladClient::fetch_folders() {
    FolderMap folders;
    fetch_paged("entity/productfolder", {}, [&folders](const nlohmann::json& page) {
        AssortmentParser::parse_folders(page, folders);
    });
    log_->info("Loaded {} product folders", folders.size());
    return folders;
}

DomainSnapshot MoyskladClient::fetch_snapshot() {
    log_->info("Fetching assortment...");

    FolderMap folders = fetch_folders();

    DomainSnapshot snapshot;
    fetch_paged("entity/assortment", {{"filter", "type=product"}},
        [&](const nlohmann::json& page) {
            auto products = AssortmentParser::parse_products(
                page, folders, options_.expiration_attribute, *log_);
            snapshot.products.insert(snapshot.products.end(),
                                     std::make_move_iterator(products.begin()),
                                     std::make_move_iterator(products.end()));
        });

    snapshot.fetched_at_ms = util::current_timestamp_ms();
    log_->info("Loaded {} products", snapshot.products.size());
    return snapshot;
}

std::optional<Counterparty> MoyskladClient::find_counterparty(const std::string& phone) {
    auto response = request("GET", "entity/counterparty",
                            {{"search", phone}, {"limit", "100"}});

    if (!response.body.contains("rows") || !response.body["rows"].is_array()) {
        throw FetchError("entity/counterparty response has no rows");
    }

    for (const auto& row : response.body["rows"]) {
        auto cp = AssortmentParser::parse_counterparty(row);
        if (!cp) continue;

        auto normalized = util::extract_phone(cp->phone);
        if (normalized && *normalized == phone) {
            return cp;
        }
    }
    return std::nullopt;
}

Counterparty MoyskladClient::create_counterparty(const std::string& phone) {
    nlohmann::json payload = {
        {"name", phone},
        {"phone", phone},
        {"companyType", "individual"},
        {"description", fmt::format("Created automatically\nDate: {}\nType: individual",
                                    util::format_datetime(util::current_timestamp_ms()))}
    };

    auto response = request("POST", "entity/counterparty", {}, payload, {409});

    if (response.status == 409) {
        log_->info("Counterparty {} already exists", phone);
        auto existing = find_counterparty(phone);
        if (!existing) {
            throw FetchError("Counterparty " + phone + " reported as existing but not found");
        }
        return *existing;
    }

    auto created = AssortmentParser::parse_counterparty(response.body);
    if (!created) {
        throw FetchError("Unexpected response creating counterparty: " +
                         response.body.dump().substr(0, 300));
    }

    log_->info("Created counterparty {} ({})", phone, created->id);
    return *created;
}

bool MoyskladClient::check_connection() {
    try {
        request("GET", "entity/counterparty", {{"limit", "1"}});
        return true;
    } catch (const FetchError& e) {
        log_->error("Connection check failed: {}", e.what());
        return false;
    }
}
