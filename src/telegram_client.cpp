#include "telegram_client.hpp"
#include "http_session.hpp"
#include <spdlog/spdlog.h>

TelegramClient::TelegramClient(const std::string& bot_token, int timeout_seconds)
    : api_base_("https://api.telegram.org/bot" + bot_token)
    , file_base_("https://api.telegram.org/file/bot" + bot_token)
    , timeout_seconds_(timeout_seconds)
{}

nlohmann::json TelegramClient::make_request(const std::string& method,
                                            const nlohmann::json& params,
                                            long timeout_seconds) {
    std::string url = api_base_ + "/" + method;
    std::string response_string;
    std::string body = params.is_null() ? "{}" : params.dump();

    CurlHandle curl = http::make_handle(timeout_seconds);
    CurlHeaders headers(curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        spdlog::error("Telegram API {} failed: {}", method, curl_easy_strerror(res));
        return nlohmann::json{{"ok", false}, {"description", curl_easy_strerror(res)}};
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse Telegram API response: {}", e.what());
        return nlohmann::json{{"ok", false}, {"description", "Parse error"}};
    }
}

bool TelegramClient::send_message(const std::string& chat_id, const std::string& text,
                                  bool silent) {
    nlohmann::json params = {
        {"chat_id", chat_id},
        {"text", text},
        {"parse_mode", "HTML"},
        {"disable_notification", silent}
    };

    auto response = make_request("sendMessage", params, timeout_seconds_);

    if (!response.value("ok", false)) {
        spdlog::error("Failed to send message: {}", response.value("description", response.dump()));
        return false;
    }

    return true;
}

bool TelegramClient::send_message(int64_t chat_id, const std::string& text) {
    return send_message(std::to_string(chat_id), text, false);
}

nlohmann::json TelegramClient::get_updates(int64_t offset, int timeout) {
    nlohmann::json params = {
        {"offset", offset},
        {"timeout", timeout},
        {"allowed_updates", nlohmann::json::array({"message"})}
    };

    return make_request("getUpdates", params, timeout + timeout_seconds_);
}

nlohmann::json TelegramClient::get_me() {
    return make_request("getMe", nlohmann::json::object(), timeout_seconds_);
}

bool TelegramClient::delete_webhook() {
    auto response = make_request("deleteWebhook", nlohmann::json::object(), timeout_seconds_);
    return response.value("ok", false);
}

nlohmann::json TelegramClient::get_file(const std::string& file_id) {
    return make_request("getFile", {{"file_id", file_id}}, timeout_seconds_);
}

std::optional<std::string> TelegramClient::download_file(const std::string& file_path,
                                                         size_t max_bytes) {
    std::string url = file_base_ + "/" + file_path;
    std::string body;

    CurlHandle curl = http::make_handle(timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(max_bytes));

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        spdlog::error("Telegram file download failed: {}", curl_easy_strerror(res));
        return std::nullopt;
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        spdlog::error("Telegram file download returned HTTP {}", status);
        return std::nullopt;
    }
    if (body.size() > max_bytes) {
        spdlog::error("Telegram file is larger than {} bytes", max_bytes);
        return std::nullopt;
    }

    return body;
}
