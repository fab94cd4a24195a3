#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace util {

namespace {

constexpr int64_t kMsPerDay = 86400LL * 1000;

std::tm to_utc_tm(int64_t ts_ms) {
    std::time_t secs = static_cast<std::time_t>(ts_ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    return tm;
}

std::string format_tm(int64_t ts_ms, const char* fmt) {
    std::tm tm = to_utc_tm(ts_ms);
    std::ostringstream ss;
    ss << std::put_time(&tm, fmt);
    return ss.str();
}

} // namespace

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (start >= end) return "";
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<int64_t> parse_id_list(const std::string& str) {
    std::vector<int64_t> ids;
    for (const auto& token : split(str, ',')) {
        std::string t = trim(token);
        if (t.empty()) continue;
        ids.push_back(std::stoll(t));
    }
    return ids;
}

std::optional<int64_t> parse_date_ms(const std::string& str) {
    static const char* formats[] = {
        "%d.%m.%Y %H:%M",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%d"
    };

    std::string input = trim(str);
    if (input.empty()) return std::nullopt;

    for (const char* fmt : formats) {
        std::tm tm{};
        std::istringstream ss(input);
        ss >> std::get_time(&tm, fmt);
        if (ss.fail()) continue;

        // Fractional seconds are accepted and dropped
        std::string rest;
        std::getline(ss, rest);
        if (!rest.empty()) {
            bool fraction = rest[0] == '.' && rest.size() > 1 &&
                std::all_of(rest.begin() + 1, rest.end(),
                            [](unsigned char c) { return std::isdigit(c); });
            if (!fraction) continue;
        }

        return static_cast<int64_t>(timegm(&tm)) * 1000;
    }
    return std::nullopt;
}

std::string format_date(int64_t ts_ms) {
    return format_tm(ts_ms, "%d.%m.%Y");
}

std::string format_iso_date(int64_t ts_ms) {
    return format_tm(ts_ms, "%Y-%m-%d");
}

std::string format_datetime(int64_t ts_ms) {
    return format_tm(ts_ms, "%d.%m.%Y %H:%M");
}

int64_t days_until(int64_t target_ms, int64_t now_ms) {
    int64_t diff = target_ms - now_ms;
    // floor division, so half a day past the date is already -1
    int64_t days = diff / kMsPerDay;
    if (diff % kMsPerDay != 0 && diff < 0) {
        days -= 1;
    }
    return days;
}

std::optional<std::string> extract_phone(const std::string& text) {
    std::string digits;
    for (unsigned char c : text) {
        if (std::isdigit(c)) digits += static_cast<char>(c);
    }
    if (digits.empty()) return std::nullopt;

    // Belarus: +375 XX XXXXXXX or 80 XX XXXXXXX
    if (digits.rfind("375", 0) == 0 && digits.size() == 12) {
        return digits.substr(3);
    }
    if (digits.rfind("80", 0) == 0 && digits.size() == 11) {
        return digits.substr(2);
    }

    // Russia: +7 XXX XXXXXXX or 8 XXX XXXXXXX
    if ((digits[0] == '7' || digits[0] == '8') && digits.size() == 11) {
        return digits.substr(1);
    }

    if (digits.size() == 9 || digits.size() == 10) {
        return digits;
    }

    return std::nullopt;
}

std::string html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c;
        }
    }
    return out;
}

} // namespace util
