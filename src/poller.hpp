#pragma once

#include "auth.hpp"
#include "config.hpp"
#include "counterparty_registrar.hpp"
#include "inventory_source.hpp"
#include "parser.hpp"
#include "scheduler.hpp"
#include "telegram_client.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <optional>
#include <thread>

// Long-polls Telegram for user commands, phone numbers and phone list files.
class TelegramPoller {
public:
    TelegramPoller(TelegramClient& tg_client,
                   CounterpartyDirectory& directory,
                   CounterpartyRegistrar& registrar,
                   const Authenticator& auth,
                   const Scheduler& scheduler,
                   const Config& config,
                   std::shared_ptr<spdlog::logger> log);
    ~TelegramPoller();

    void start();
    void stop();
    bool is_running() const { return running_; }

private:
    TelegramClient& tg_client_;
    CounterpartyDirectory& directory_;
    CounterpartyRegistrar& registrar_;
    const Authenticator& auth_;
    const Scheduler& scheduler_;
    const Config& config_;
    std::shared_ptr<spdlog::logger> log_;

    std::atomic<bool> running_{false};
    std::thread poll_thread_;
    int64_t last_update_id_ = 0;

    void poll_loop();
    void pause(std::chrono::seconds duration) const;
    void process_update(const nlohmann::json& update);
    std::optional<AuthResult> authorize(int64_t chat_id, int64_t user_id);
    void handle_message(int64_t chat_id, int64_t user_id, const std::string& text);
    void handle_phone(int64_t chat_id, int64_t user_id, const std::string& text);
    void handle_document(int64_t chat_id, int64_t user_id, const nlohmann::json& document);
    void send_help(int64_t chat_id, UserRole role);
    void send_status(int64_t chat_id);
    void send_stats(int64_t chat_id);
};
