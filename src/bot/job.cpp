#include "job.hpp"

namespace {

constexpr const char* kVoiceMessageName = "voice_message.ogg";

std::string mime_subtype(const std::string& mime) {
    auto slash = mime.find('/');
    if (slash == std::string::npos || slash + 1 == mime.size()) return "bin";
    return mime.substr(slash + 1);
}

} // namespace

std::string resolve_file_name(const AudioDescriptor& audio) {
    if (audio.display_name && !audio.display_name->empty()) {
        return *audio.display_name;
    }
    if (audio.mime_type == "audio/ogg") {
        return kVoiceMessageName;
    }
    return "audio_file_" + audio.unique_id + "." + mime_subtype(audio.mime_type);
}

TranscriptionJob make_job(const AudioDescriptor& audio, ChatId chat_id,
                          MessageId source_message_id, MessageId status_message_id) {
    return TranscriptionJob{
        .chat_id = chat_id,
        .source_message_id = source_message_id,
        .source_id = audio.source_id,
        .resolved_file_name = resolve_file_name(audio),
        .mime_type = audio.mime_type,
        .declared_size = audio.declared_size,
        .status_message_id = status_message_id,
    };
}
