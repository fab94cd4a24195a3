#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

void Config::load_env_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        line = util::trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = util::trim(line.substr(0, eq));
        std::string value = util::trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }
}

Config Config::from_env() {
    load_env_file(get_env("STOCKWATCH_ENV_FILE", ".env"));

    Config cfg;

    cfg.tg_bot_token = get_env("TG_BOT_TOKEN");
    cfg.chat_id = get_env("CHAT_ID");
    cfg.tg_message_limit = get_env_int("TG_MESSAGE_LIMIT", 4096);
    cfg.tg_chunk_delay_ms = get_env_int("TG_CHUNK_DELAY_MS", 1000);
    cfg.tg_poll_timeout_seconds = get_env_int("TG_POLL_TIMEOUT_SECONDS", 10);

    try {
        cfg.allowed_user_ids = util::parse_id_list(get_env("ALLOWED_USER_IDS"));
        cfg.admin_user_ids = util::parse_id_list(get_env("ADMIN_USER_IDS"));
    } catch (const std::exception& e) {
        throw SetupError(std::string("Invalid user id list: ") + e.what());
    }

    cfg.ms_token = get_env("MS_TOKEN");
    cfg.ms_base_url = get_env("MS_BASE_URL", "https://api.moysklad.ru/api/remap/1.2");
    cfg.api_page_limit = get_env_int("API_PAGE_LIMIT", 500);
    cfg.request_timeout_seconds = get_env_int("REQUEST_TIMEOUT_SECONDS", 30);
    cfg.fetch_attempts = get_env_int("FETCH_ATTEMPTS", 3);
    cfg.fetch_retry_delay_seconds = get_env_int("FETCH_RETRY_DELAY_SECONDS", 5);
    cfg.expiration_attribute = get_env("EXPIRATION_ATTRIBUTE", "Срок годности");

    cfg.check_interval_minutes = get_env_int("CHECK_INTERVAL_MINUTES", 720);
    cfg.alert_days = get_env_int("ALERT_DAYS", 7);
    cfg.expiration_critical_days = get_env_int("EXPIRATION_CRITICAL_DAYS", 3);
    cfg.stock_buckets = get_env_int("STOCK_BUCKETS", 4);
    cfg.suppression_hours = get_env_int("SUPPRESSION_HOURS", 168);

    cfg.data_dir = get_env("DATA_DIR", "data");
    cfg.cache_reset_days = get_env_int("CACHE_RESET_DAYS", 30);
    cfg.cache_purge_every_cycles = get_env_int("CACHE_PURGE_EVERY_CYCLES", 24);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "stockwatch");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    cfg.log_reset_days = get_env_int("LOG_RESET_DAYS", 30);

    return cfg;
}

void Config::validate() const {
    if (tg_bot_token.empty()) {
        throw SetupError("TG_BOT_TOKEN is required");
    }
    if (ms_token.empty()) {
        throw SetupError("MS_TOKEN is required");
    }
    if (chat_id.empty()) {
        throw SetupError("CHAT_ID is required");
    }

    auto require_positive = [](const char* name, int value) {
        if (value <= 0) {
            throw SetupError(std::string(name) + " must be > 0");
        }
    };
    auto require_non_negative = [](const char* name, int value) {
        if (value < 0) {
            throw SetupError(std::string(name) + " must be >= 0");
        }
    };

    require_positive("CHECK_INTERVAL_MINUTES", check_interval_minutes);
    require_positive("CACHE_RESET_DAYS", cache_reset_days);
    require_positive("CACHE_PURGE_EVERY_CYCLES", cache_purge_every_cycles);
    if (tg_message_limit < kMinMessageLimit) {
        throw SetupError("TG_MESSAGE_LIMIT must be >= " + std::to_string(kMinMessageLimit));
    }
    require_positive("TG_POLL_TIMEOUT_SECONDS", tg_poll_timeout_seconds);
    require_positive("API_PAGE_LIMIT", api_page_limit);
    require_positive("REQUEST_TIMEOUT_SECONDS", request_timeout_seconds);
    require_positive("FETCH_ATTEMPTS", fetch_attempts);
    require_positive("STOCK_BUCKETS", stock_buckets);
    require_positive("LOG_RESET_DAYS", log_reset_days);
    require_non_negative("ALERT_DAYS", alert_days);
    require_non_negative("EXPIRATION_CRITICAL_DAYS", expiration_critical_days);
    require_non_negative("SUPPRESSION_HOURS", suppression_hours);
    require_non_negative("TG_CHUNK_DELAY_MS", tg_chunk_delay_ms);
    require_non_negative("FETCH_RETRY_DELAY_SECONDS", fetch_retry_delay_seconds);

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Check interval: {} min", check_interval_minutes);
    spdlog::info("  Alert days: {} (critical {})", alert_days, expiration_critical_days);
    spdlog::info("  Cache reset: {} days, suppression: {}h",
                 cache_reset_days, suppression_hours);
}

bool Config::is_admin(int64_t user_id) const {
    return std::find(admin_user_ids.begin(), admin_user_ids.end(), user_id)
           != admin_user_ids.end();
}

bool Config::is_allowed(int64_t user_id) const {
    return is_admin(user_id) ||
           std::find(allowed_user_ids.begin(), allowed_user_ids.end(), user_id)
           != allowed_user_ids.end();
}
