#include "poller.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <thread>

TelegramPoller::TelegramPoller(TelegramClient& tg_client,
                               CounterpartyDirectory& directory,
                               CounterpartyRegistrar& registrar,
                               const Authenticator& auth,
                               const Scheduler& scheduler,
                               const Config& config,
                               std::shared_ptr<spdlog::logger> log)
    : tg_client_(tg_client)
    , directory_(directory)
    , registrar_(registrar)
    , auth_(auth)
    , scheduler_(scheduler)
    , config_(config)
    , log_(std::move(log))
{}

TelegramPoller::~TelegramPoller() {
    stop();
}

void TelegramPoller::start() {
    if (running_) {
        log_->warn("Poller already running");
        return;
    }

    running_ = true;
    poll_thread_ = std::thread(&TelegramPoller::poll_loop, this);
    log_->info("Telegram poller started");
}

void TelegramPoller::stop() {
    if (!running_) return;

    running_ = false;
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
    log_->info("Telegram poller stopped");
}

void TelegramPoller::pause(std::chrono::seconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (running_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

void TelegramPoller::poll_loop() {
    while (running_) {
        try {
            auto response = tg_client_.get_updates(last_update_id_ + 1,
                                                   config_.tg_poll_timeout_seconds);

            if (!response.value("ok", false)) {
                log_->error("getUpdates failed: {}", response.dump());
                pause(std::chrono::seconds(5));
                continue;
            }

            for (const auto& update : response["result"]) {
                int64_t update_id = update.value("update_id", int64_t{0});
                if (update_id > last_update_id_) {
                    last_update_id_ = update_id;
                }

                try {
                    process_update(update);
                } catch (const std::exception& e) {
                    log_->error("Failed to process update {}: {}", update_id, e.what());
                }
            }

        } catch (const std::exception& e) {
            log_->error("Poll loop error: {}", e.what());
            pause(std::chrono::seconds(5));
        }
    }
}

void TelegramPoller::process_update(const nlohmann::json& update) {
    if (!update.contains("message")) return;

    const auto& msg = update["message"];
    if (!msg.contains("from") || !msg.contains("chat")) {
        return;
    }

    int64_t chat_id = msg["chat"]["id"].get<int64_t>();
    int64_t user_id = msg["from"]["id"].get<int64_t>();

    if (msg.contains("document") && msg["document"].is_object()) {
        if (authorize(chat_id, user_id)) {
            handle_document(chat_id, user_id, msg["document"]);
        }
        return;
    }

    if (!msg.contains("text")) return;
    handle_message(chat_id, user_id, msg["text"].get<std::string>());
}

std::optional<AuthResult> TelegramPoller::authorize(int64_t chat_id, int64_t user_id) {
    auto auth_result = auth_.authenticate(user_id);
    if (!auth_result.authorized) {
        log_->warn("Unauthorized access attempt from user {}", user_id);
        tg_client_.send_message(chat_id, auth_result.message.value_or("Access denied."));
        return std::nullopt;
    }
    return auth_result;
}

void TelegramPoller::handle_message(int64_t chat_id, int64_t user_id, const std::string& text) {
    auto authorized = authorize(chat_id, user_id);
    if (!authorized) return;
    const AuthResult& auth_result = *authorized;

    if (!CommandParser::is_command(text)) {
        handle_phone(chat_id, user_id, text);
        return;
    }

    auto parsed = CommandParser::parse(text);
    if (!parsed.is_valid()) {
        tg_client_.send_message(chat_id, util::html_escape(*parsed.error));
        return;
    }

    if (!auth_.is_command_allowed(parsed.cmd, auth_result.role)) {
        tg_client_.send_message(chat_id, "⛔ You don't have permission for this command.");
        return;
    }

    log_->info("User {} ({}) sent /{}", user_id, auth_result.role_string(), parsed.cmd);

    if (parsed.cmd == "start") {
        tg_client_.send_message(chat_id,
            "👋 Welcome to <b>Stockwatch</b>!\n\n"
            "Send a phone number to find or create a counterparty,\n"
            "or a .csv file to import a whole list.\n"
            "Send /help for commands.");
    } else if (parsed.cmd == "help") {
        send_help(chat_id, auth_result.role);
    } else if (parsed.cmd == "status") {
        send_status(chat_id);
    } else if (parsed.cmd == "stats") {
        send_stats(chat_id);
    }
}

void TelegramPoller::handle_phone(int64_t chat_id, int64_t user_id, const std::string& text) {
    auto phone = util::extract_phone(text);
    if (!phone) {
        tg_client_.send_message(chat_id,
            "❌ Not a phone number. Use +375XXXXXXXXX, 80XXXXXXXXX, +7XXXXXXXXXX or 8XXXXXXXXXX.");
        return;
    }

    if (registrar_.is_known(*phone)) {
        tg_client_.send_message(chat_id,
            fmt::format("ℹ️ Counterparty <code>{}</code> already exists.", *phone));
        return;
    }

    try {
        auto resolution = registrar_.resolve(*phone);
        registrar_.persist();

        bool created = resolution.created;
        log_->info("User {}: counterparty {} {}", user_id, *phone, created ? "created" : "found");
        tg_client_.send_message(chat_id, created
            ? fmt::format("✅ Counterparty <code>{}</code> created.", *phone)
            : fmt::format("ℹ️ Counterparty <code>{}</code> already exists: {}",
                          *phone, util::html_escape(resolution.counterparty.name)));

    } catch (const FetchError& e) {
        log_->error("Counterparty lookup for {} failed: {}", *phone, e.what());
        tg_client_.send_message(chat_id, "🔴 MoySklad API error, try again later.");
    }
}

void TelegramPoller::handle_document(int64_t chat_id, int64_t user_id,
                                     const nlohmann::json& document) {
    std::string file_name = document.value("file_name", std::string());
    int64_t file_size = document.value("file_size", int64_t{0});
    log_->info("User {} uploaded {} ({} bytes)", user_id, file_name, file_size);

    if (!CounterpartyRegistrar::is_supported_file(file_name)) {
        tg_client_.send_message(chat_id,
            "❌ Send a .csv or .txt file with phone numbers. "
            "Excel sheets can be saved as CSV first.");
        return;
    }
    if (file_size > static_cast<int64_t>(CounterpartyRegistrar::kMaxFileBytes)) {
        tg_client_.send_message(chat_id, "❌ File is too large (max 10 MB).");
        return;
    }

    auto file = tg_client_.get_file(document.value("file_id", std::string()));
    std::string file_path;
    if (file.value("ok", false) && file.contains("result")) {
        file_path = file["result"].value("file_path", std::string());
    }
    if (file_path.empty()) {
        log_->error("getFile failed: {}", file.dump());
        tg_client_.send_message(chat_id, "❌ Could not download the file.");
        return;
    }

    auto content = tg_client_.download_file(file_path, CounterpartyRegistrar::kMaxFileBytes);
    if (!content) {
        tg_client_.send_message(chat_id, "❌ Could not download the file.");
        return;
    }

    auto phones = CounterpartyRegistrar::extract_phones(*content);
    if (phones.empty()) {
        tg_client_.send_message(chat_id, "🔍 No phone numbers found in the file.");
        return;
    }

    tg_client_.send_message(chat_id,
        fmt::format("🔍 Found {} numbers. Processing...", phones.size()));

    auto summary = registrar_.import(phones, [this, chat_id](size_t processed, size_t total) {
        if (processed < total) {
            tg_client_.send_message(chat_id, fmt::format("⏳ Processed {}/{}...", processed, total));
        }
        return running_.load();
    });

    std::string result = fmt::format(
        "📊 <b>Import summary</b>\n\n"
        "• Added: <b>{}</b>\n"
        "• Skipped (duplicates): <b>{}</b>\n"
        "• Errors: <b>{}</b>",
        summary.added, summary.skipped, summary.failed.size());

    if (!summary.failed.empty()) {
        const size_t shown = std::min<size_t>(summary.failed.size(), 20);
        result += "\n\nFailed:";
        for (size_t i = 0; i < shown; i++) {
            result += fmt::format("\n<code>{}</code>", summary.failed[i]);
        }
        if (summary.failed.size() > shown) {
            result += fmt::format("\n... and {} more", summary.failed.size() - shown);
        }
    }
    if (summary.aborted) {
        result += fmt::format("\n\n⚠️ Stopped after {}/{} numbers.", summary.processed, phones.size());
    }

    tg_client_.send_message(chat_id, result);
}

void TelegramPoller::send_help(int64_t chat_id, UserRole role) {
    std::string help_text = "📚 <b>Stockwatch</b>\n\n";

    help_text += "Send a phone number to find or create an individual counterparty.\n";
    help_text += "Send a .csv or .txt file to import many numbers at once.\n\n";

    help_text += "<b>Commands:</b>\n";
    help_text += "/start - Welcome message\n";
    help_text += "/status - API and scheduler status\n";

    if (role == UserRole::Admin) {
        help_text += "/stats - Scheduler counters\n";
    }

    help_text += "/help - Show this help";

    tg_client_.send_message(chat_id, help_text);
}

void TelegramPoller::send_status(int64_t chat_id) {
    bool api_ok = directory_.check_connection();
    auto state = scheduler_.state();
    auto stats = scheduler_.stats();

    std::string text = api_ok ? "🟢 MoySklad API is reachable\n" : "🔴 MoySklad API is unreachable\n";
    text += fmt::format("⚙️ Scheduler: {}\n", to_string(state));
    if (stats.last_success_ms > 0) {
        text += fmt::format("✅ Last successful check: {} UTC\n",
                            util::format_datetime(stats.last_success_ms));
    }
    if (stats.next_tick_ms > 0 && state == SchedulerState::Running) {
        text += fmt::format("⏰ Next check: {} UTC", util::format_datetime(stats.next_tick_ms));
    }

    tg_client_.send_message(chat_id, text);
}

void TelegramPoller::send_stats(int64_t chat_id) {
    auto stats = scheduler_.stats();

    tg_client_.send_message(chat_id, fmt::format(
        "📈 <b>Statistics</b>\n\n"
        "Cycles: {}\n"
        "Failed fetches: {}\n"
        "Products in last snapshot: {}\n"
        "Notifications: {}\n"
        "Messages sent: {}\n"
        "Known phones: {}",
        stats.cycles, stats.failed_fetches, stats.last_product_count,
        stats.notifications, stats.chunks_delivered, registrar_.known_count()));
}
