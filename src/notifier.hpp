#pragma once

#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Outbound message channel. Returns false when the provider rejected or
// never received the message.
class MessageTransport {
public:
    virtual ~MessageTransport() = default;
    virtual bool send_message(const std::string& chat_id, const std::string& text,
                              bool silent) = 0;
};

// Best-effort delivery to one chat. Oversized payloads are split into chunks
// of at most `message_limit` bytes; a failed chunk is logged and dropped.
class Notifier {
public:
    Notifier(MessageTransport& transport,
             std::string chat_id,
             size_t message_limit,
             std::chrono::milliseconds chunk_delay,
             std::shared_ptr<spdlog::logger> log);

    // Paragraphs (blank-line separated) are kept whole where possible.
    size_t send(const std::string& text, bool silent = false);

    // `header` leads the first chunk; each block stays in one chunk unless
    // it alone exceeds the limit.
    size_t send(const std::string& header, const std::vector<std::string>& blocks,
                bool silent = false);

    static std::vector<std::string> split_message(const std::string& header,
                                                  const std::vector<std::string>& blocks,
                                                  size_t limit);

    size_t message_limit() const { return message_limit_; }

private:
    MessageTransport& transport_;
    std::string chat_id_;
    size_t message_limit_;
    std::chrono::milliseconds chunk_delay_;
    std::shared_ptr<spdlog::logger> log_;

    size_t deliver(const std::vector<std::string>& chunks, bool silent);
};
