#pragma once

#include "notifier.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

class TelegramClient : public MessageTransport {
public:
    TelegramClient(const std::string& bot_token, int timeout_seconds = 30);

    // Disable copy
    TelegramClient(const TelegramClient&) = delete;
    TelegramClient& operator=(const TelegramClient&) = delete;

    bool send_message(const std::string& chat_id, const std::string& text,
                      bool silent) override;
    bool send_message(int64_t chat_id, const std::string& text);

    // Long polling; the HTTP timeout is stretched past `timeout`.
    nlohmann::json get_updates(int64_t offset, int timeout);

    // Used at startup to validate the token
    nlohmann::json get_me();
    bool delete_webhook();

    // Resolves a document's file_id to a download path
    nlohmann::json get_file(const std::string& file_id);
    // Empty on transport errors, non-200 replies or bodies over max_bytes
    std::optional<std::string> download_file(const std::string& file_path, size_t max_bytes);

private:
    std::string api_base_;
    std::string file_base_;
    long timeout_seconds_;

    // Each call uses its own easy handle, so the scheduler and the poller
    // thread can share one client.
    nlohmann::json make_request(const std::string& method,
                                const nlohmann::json& params,
                                long timeout_seconds);
};
