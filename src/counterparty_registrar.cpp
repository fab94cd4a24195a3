#include "counterparty_registrar.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <set>

namespace {

const std::vector<std::string> kPhoneColumns = {
    "наименование", "Наименование", "телефон", "Телефон", "phone", "name"
};

// The first line holding a separator decides it for the whole file.
char detect_delimiter(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        for (char delim : {';', '\t', ','}) {
            if (line.find(delim) != std::string::npos) return delim;
        }
    }
    return '\0';
}

std::vector<std::string> split_cells(const std::string& line, char delim) {
    std::vector<std::string> cells =
        delim == '\0' ? std::vector<std::string>{line} : util::split(line, delim);

    for (auto& cell : cells) {
        cell = util::trim(cell);
        if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
            cell = util::trim(cell.substr(1, cell.size() - 2));
        }
    }
    return cells;
}

std::string ascii_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_phone_column(const std::string& cell) {
    std::string lowered = ascii_lower(cell);
    return std::find(kPhoneColumns.begin(), kPhoneColumns.end(), lowered) != kPhoneColumns.end();
}

} // namespace

CounterpartyRegistrar::CounterpartyRegistrar(CounterpartyDirectory& directory,
                                             CacheStore& phone_cache,
                                             std::shared_ptr<spdlog::logger> log,
                                             size_t batch_size)
    : directory_(directory)
    , phone_cache_(phone_cache)
    , log_(std::move(log))
    , batch_size_(std::max<size_t>(batch_size, 1))
{}

bool CounterpartyRegistrar::is_known(const std::string& phone) const {
    return phone_cache_.get(phone).has_value();
}

CounterpartyRegistrar::Resolution CounterpartyRegistrar::resolve(const std::string& phone) {
    Resolution resolution;

    auto existing = directory_.find_counterparty(phone);
    if (existing) {
        resolution.counterparty = *existing;
    } else {
        resolution.counterparty = directory_.create_counterparty(phone);
        resolution.created = true;
    }

    int64_t now_ms = util::current_timestamp_ms();
    phone_cache_.put(phone, CacheRecord{now_ms, now_ms, resolution.counterparty.id});
    return resolution;
}

ImportSummary CounterpartyRegistrar::import(const std::vector<std::string>& phones,
                                            const Progress& progress) {
    ImportSummary summary;
    const size_t total = phones.size();

    for (size_t start = 0; start < total; start += batch_size_) {
        size_t end = std::min(start + batch_size_, total);

        for (size_t i = start; i < end; i++) {
            const auto& phone = phones[i];
            if (is_known(phone)) {
                summary.skipped++;
                continue;
            }

            try {
                auto resolution = resolve(phone);
                if (resolution.created) {
                    summary.added++;
                } else {
                    summary.skipped++;
                }
            } catch (const FetchError& e) {
                log_->error("Import of {} failed: {}", phone, e.what());
                summary.failed.push_back(phone);
            }
        }

        summary.processed = end;
        persist();

        if (progress && !progress(end, total)) {
            summary.aborted = end < total;
            break;
        }
    }

    log_->info("Phone import: {} added, {} skipped, {} failed of {}",
               summary.added, summary.skipped, summary.failed.size(), total);
    return summary;
}

bool CounterpartyRegistrar::persist() {
    if (!phone_cache_.persist()) {
        log_->error("Phone cache not persisted");
        return false;
    }
    return true;
}

std::vector<std::string> CounterpartyRegistrar::extract_phones(const std::string& content) {
    std::string text = content;
    if (text.rfind("\xEF\xBB\xBF", 0) == 0) {
        text.erase(0, 3);
    }

    std::vector<std::string> lines;
    for (auto& line : util::split(text, '\n')) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!util::trim(line).empty()) lines.push_back(line);
    }
    if (lines.empty()) return {};

    const char delim = detect_delimiter(lines);

    std::optional<size_t> column;
    size_t first_row = 0;
    auto header = split_cells(lines.front(), delim);
    for (size_t i = 0; i < header.size(); i++) {
        if (is_phone_column(header[i])) {
            column = i;
            first_row = 1;
            break;
        }
    }

    std::vector<std::string> phones;
    std::set<std::string> seen;
    auto take = [&](const std::string& cell) {
        auto phone = util::extract_phone(cell);
        if (phone && seen.insert(*phone).second) {
            phones.push_back(*phone);
        }
    };

    for (size_t row = first_row; row < lines.size(); row++) {
        auto cells = split_cells(lines[row], delim);
        if (column) {
            if (*column < cells.size()) take(cells[*column]);
        } else {
            for (const auto& cell : cells) take(cell);
        }
    }

    return phones;
}

bool CounterpartyRegistrar::is_supported_file(const std::string& file_name) {
    auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos) return false;
    std::string ext = ascii_lower(file_name.substr(dot + 1));
    return ext == "csv" || ext == "txt";
}
