#pragma once

#include "audio_descriptor.hpp"

#include <cstdint>
#include <string>

using ChatId = int64_t;
using MessageId = int64_t;

struct TranscriptionJob {
    ChatId chat_id = 0;
    MessageId source_message_id = 0;
    std::string source_id;
    std::string resolved_file_name;
    std::string mime_type;
    uint64_t declared_size = 0;
    MessageId status_message_id = 0;
};

// Name used in logs and for the scratch file: the display name when the
// transport provides one, a fixed name for voice notes, otherwise one
// synthesized from the unique id and the MIME subtype.
std::string resolve_file_name(const AudioDescriptor& audio);

TranscriptionJob make_job(const AudioDescriptor& audio, ChatId chat_id,
                          MessageId source_message_id, MessageId status_message_id);
