#pragma once

#include "audio_descriptor.hpp"
#include "job.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct InboundMessage {
    ChatId chat_id = 0;
    MessageId message_id = 0;
    std::string text;
    std::optional<AudioDescriptor> audio;
};

struct Update {
    int64_t update_id = 0;
    std::optional<InboundMessage> message;
};

// Parses the "result" array of a getUpdates response. Updates that are not
// messages, or whose message is malformed, are kept with no message so the
// offset still advances. Fails only when result is not an array.
std::expected<std::vector<Update>, std::string> parse_updates(const nlohmann::json& result);

// Offset for the next getUpdates call: one past the highest update_id seen.
int64_t next_offset(const std::vector<Update>& updates, int64_t offset);

// Voice notes, audio files and documents with an audio/* MIME type.
std::optional<AudioDescriptor> extract_audio(const nlohmann::json& message);
