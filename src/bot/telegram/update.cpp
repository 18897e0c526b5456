#include "update.hpp"

#include <algorithm>
#include <print>

using json = nlohmann::json;

namespace {

AudioDescriptor descriptor_from(const json& media, const std::string& default_mime) {
    AudioDescriptor d;
    d.source_id = media.value("file_id", "");
    d.unique_id = media.value("file_unique_id", "");
    d.declared_size = media.value("file_size", uint64_t{0});
    d.mime_type = media.value("mime_type", default_mime);
    if (media.contains("file_name") && media["file_name"].is_string()) {
        d.display_name = media["file_name"].get<std::string>();
    }
    return d;
}

} // namespace

std::optional<AudioDescriptor> extract_audio(const json& message) {
    if (message.contains("voice")) {
        return descriptor_from(message["voice"], "audio/ogg");
    }
    if (message.contains("audio")) {
        return descriptor_from(message["audio"], "audio/mpeg");
    }
    if (message.contains("document")) {
        auto& doc = message["document"];
        std::string mime = doc.value("mime_type", "");
        if (mime.starts_with("audio/")) {
            return descriptor_from(doc, mime);
        }
    }
    return std::nullopt;
}

std::expected<std::vector<Update>, std::string> parse_updates(const json& result) {
    if (!result.is_array()) {
        return std::unexpected("getUpdates result is not an array");
    }

    std::vector<Update> updates;
    for (auto& u : result) {
        if (!u.is_object() || !u.contains("update_id") || !u["update_id"].is_number_integer()) {
            std::println(stderr, "[transcribe-bot] Skipping update without update_id: {}",
                         u.dump(-1, ' ', false, json::error_handler_t::replace));
            continue;
        }

        Update update;
        update.update_id = u["update_id"].get<int64_t>();

        // A malformed message is dropped but its update_id still counts,
        // otherwise the same batch would be redelivered forever.
        if (u.contains("message")) {
            try {
                auto& m = u["message"];
                InboundMessage msg;
                msg.chat_id = m.at("chat").at("id").get<ChatId>();
                msg.message_id = m.at("message_id").get<MessageId>();
                msg.text = m.value("text", "");
                msg.audio = extract_audio(m);
                update.message = std::move(msg);
            } catch (const json::exception& e) {
                std::println(stderr, "[transcribe-bot] Skipping malformed message in update {}: {}",
                             update.update_id, e.what());
            }
        }

        updates.push_back(std::move(update));
    }
    return updates;
}

int64_t next_offset(const std::vector<Update>& updates, int64_t offset) {
    for (const auto& u : updates) {
        offset = std::max(offset, u.update_id + 1);
    }
    return offset;
}
