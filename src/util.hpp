#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();

    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::vector<int64_t> parse_id_list(const std::string& str);

    // Accepts "dd.mm.YYYY HH:MM", "YYYY-mm-dd HH:MM:SS[.ffffff]" and "YYYY-mm-dd".
    // The result is epoch milliseconds, interpreted as UTC.
    std::optional<int64_t> parse_date_ms(const std::string& str);
    std::string format_date(int64_t ts_ms);          // dd.mm.YYYY
    std::string format_iso_date(int64_t ts_ms);      // YYYY-mm-dd
    std::string format_datetime(int64_t ts_ms);      // dd.mm.YYYY HH:MM
    int64_t days_until(int64_t target_ms, int64_t now_ms);

    // Normalizes Belarusian (+375 / 80) and Russian (+7 / 8) phone numbers
    // to their national significant digits.
    std::optional<std::string> extract_phone(const std::string& text);

    std::string html_escape(const std::string& text);
}
