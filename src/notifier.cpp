#include "notifier.hpp"
#include <algorithm>
#include <thread>

namespace {

struct Unit {
    std::string text;
    const char* sep;   // joins this unit to the previous one in a chunk
};

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Last resort for a single line longer than the limit. Cuts on UTF-8
// character boundaries; a limit narrower than one character yields that
// character whole.
std::vector<std::string> hard_split(const std::string& line, size_t limit) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t len = std::min(std::max<size_t>(limit, 1), line.size() - pos);
        if (pos + len < line.size()) {
            size_t cut = len;
            while (cut > 0 && is_utf8_continuation(line[pos + cut])) cut--;
            if (cut > 0) {
                len = cut;
            } else {
                while (pos + len < line.size() && is_utf8_continuation(line[pos + len])) len++;
            }
        }
        parts.push_back(line.substr(pos, len));
        pos += len;
    }
    return parts;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

void add_units(std::vector<Unit>& units, const std::string& block, size_t limit) {
    if (block.empty()) return;

    if (block.size() <= limit) {
        units.push_back({block, "\n\n"});
        return;
    }

    bool first = true;
    for (const auto& line : split_lines(block)) {
        if (line.size() <= limit) {
            units.push_back({line, first ? "\n\n" : "\n"});
        } else {
            auto parts = hard_split(line, limit);
            for (size_t k = 0; k < parts.size(); k++) {
                const char* sep = k > 0 ? "" : (first ? "\n\n" : "\n");
                units.push_back({parts[k], sep});
            }
        }
        first = false;
    }
}

std::vector<std::string> split_paragraphs(const std::string& text) {
    std::vector<std::string> paragraphs;
    size_t start = 0;
    while (start <= text.size()) {
        size_t sep = text.find("\n\n", start);
        if (sep == std::string::npos) {
            paragraphs.push_back(text.substr(start));
            break;
        }
        paragraphs.push_back(text.substr(start, sep - start));
        start = sep + 2;
    }
    return paragraphs;
}

} // namespace

Notifier::Notifier(MessageTransport& transport,
                   std::string chat_id,
                   size_t message_limit,
                   std::chrono::milliseconds chunk_delay,
                   std::shared_ptr<spdlog::logger> log)
    : transport_(transport)
    , chat_id_(std::move(chat_id))
    , message_limit_(message_limit)
    , chunk_delay_(chunk_delay)
    , log_(std::move(log))
{}

std::vector<std::string> Notifier::split_message(const std::string& header,
                                                 const std::vector<std::string>& blocks,
                                                 size_t limit) {
    std::vector<Unit> units;
    add_units(units, header, limit);
    for (const auto& block : blocks) {
        add_units(units, block, limit);
    }

    std::vector<std::string> chunks;
    std::string current;
    for (const auto& unit : units) {
        if (current.empty()) {
            current = unit.text;
            continue;
        }
        size_t joined = current.size() + std::char_traits<char>::length(unit.sep) + unit.text.size();
        if (joined <= limit) {
            current += unit.sep;
            current += unit.text;
        } else {
            chunks.push_back(current);
            current = unit.text;
        }
    }
    if (!current.empty()) {
        chunks.push_back(current);
    }
    return chunks;
}

size_t Notifier::send(const std::string& text, bool silent) {
    return deliver(split_message("", split_paragraphs(text), message_limit_), silent);
}

size_t Notifier::send(const std::string& header, const std::vector<std::string>& blocks,
                      bool silent) {
    if (blocks.empty()) return 0;
    return deliver(split_message(header, blocks, message_limit_), silent);
}

size_t Notifier::deliver(const std::vector<std::string>& chunks, bool silent) {
    size_t delivered = 0;

    for (size_t i = 0; i < chunks.size(); i++) {
        if (i > 0 && chunk_delay_.count() > 0) {
            std::this_thread::sleep_for(chunk_delay_);
        }

        bool ok = false;
        try {
            ok = transport_.send_message(chat_id_, chunks[i], silent);
        } catch (const std::exception& e) {
            log_->error("Chunk {}/{} delivery threw: {}", i + 1, chunks.size(), e.what());
        }

        if (ok) {
            delivered++;
        } else {
            log_->error("Failed to deliver chunk {}/{} ({} bytes) to {}",
                        i + 1, chunks.size(), chunks[i].size(), chat_id_);
        }
    }

    if (chunks.size() > 1) {
        log_->debug("Delivered {}/{} chunks", delivered, chunks.size());
    }
    return delivered;
}
