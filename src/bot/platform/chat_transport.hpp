#pragma once

#include "job.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

// What the processing core needs from a chat service. Implementations must
// tolerate calls from several worker threads at once.
class ChatTransport {
public:
    virtual ~ChatTransport() = default;

    // Downloads the file behind source_id into dest_dir and returns its path.
    virtual std::expected<std::filesystem::path, std::string>
        fetch_file(const std::string& source_id, const std::filesystem::path& dest_dir) = 0;

    virtual std::expected<MessageId, std::string>
        send_message(ChatId chat, const std::string& text,
                     std::optional<MessageId> reply_to = std::nullopt) = 0;

    virtual std::expected<void, std::string>
        edit_message(ChatId chat, MessageId message, const std::string& text) = 0;

    virtual std::expected<void, std::string>
        delete_message(ChatId chat, MessageId message) = 0;
};
