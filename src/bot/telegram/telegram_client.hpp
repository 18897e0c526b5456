#pragma once

#include "platform/chat_transport.hpp"
#include "update.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stop_token>
#include <string>
#include <vector>

// JSON request body for a Bot API call. Invalid UTF-8 in strings (a model can
// cut a multi-byte character in half) is replaced with U+FFFD instead of
// throwing.
std::string encode_request(const nlohmann::json& params);

// Telegram Bot API over HTTPS. Every call uses its own curl handle, so the
// client can be shared by the poller and all workers.
class TelegramClient : public ChatTransport {
public:
    TelegramClient(std::string token, std::string api_url = "https://api.telegram.org",
                   uint32_t poll_timeout_s = 30);

    // Long poll. Returns early (with an error) once stop is requested.
    std::expected<std::vector<Update>, std::string>
        get_updates(int64_t offset, std::stop_token stop = {});

    std::expected<std::filesystem::path, std::string>
        fetch_file(const std::string& source_id, const std::filesystem::path& dest_dir) override;

    std::expected<MessageId, std::string>
        send_message(ChatId chat, const std::string& text,
                     std::optional<MessageId> reply_to = std::nullopt) override;

    std::expected<void, std::string>
        edit_message(ChatId chat, MessageId message, const std::string& text) override;

    std::expected<void, std::string>
        delete_message(ChatId chat, MessageId message) override;

private:
    std::expected<nlohmann::json, std::string>
        call(const std::string& method, const nlohmann::json& params,
             long timeout_s, std::stop_token stop = {});

    std::string token_;
    std::string api_url_;
    uint32_t poll_timeout_s_;
};
