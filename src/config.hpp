#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

struct Config {
    // Telegram
    std::string tg_bot_token;
    std::string chat_id;
    static constexpr int kMinMessageLimit = 16;
    int tg_message_limit;
    int tg_chunk_delay_ms;
    int tg_poll_timeout_seconds;
    std::vector<int64_t> allowed_user_ids;
    std::vector<int64_t> admin_user_ids;

    // MoySklad
    std::string ms_token;
    std::string ms_base_url;
    int api_page_limit;
    int request_timeout_seconds;
    int fetch_attempts;
    int fetch_retry_delay_seconds;
    std::string expiration_attribute;

    // Checks
    int check_interval_minutes;
    int alert_days;
    int expiration_critical_days;
    int stock_buckets;
    int suppression_hours;

    // Cache
    std::string data_dir;
    int cache_reset_days;
    int cache_purge_every_cycles;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;
    int log_reset_days;

    static Config from_env();
    void validate() const;

    std::string cache_dir() const { return data_dir + "/cache"; }
    std::string logs_dir() const { return data_dir + "/logs"; }

    bool is_admin(int64_t user_id) const;
    bool is_allowed(int64_t user_id) const;

    // Sets variables from a KEY=VALUE file without overriding the environment.
    // A missing file is not an error.
    static void load_env_file(const std::string& path);

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
