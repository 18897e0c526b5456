#pragma once

#include "admission_control.hpp"
#include "audio_descriptor.hpp"
#include "config.hpp"
#include "job_queue.hpp"
#include "platform/chat_transport.hpp"
#include "telegram/update.hpp"

#include <cstddef>
#include <expected>
#include <string>

// Inbound side of the bot: commands, audio detection and admission. Runs on
// the event loop thread; the only producer for the job queue.
class BotCore {
public:
    BotCore(const Config& config, ChatTransport& transport, JobQueue& queue,
            AdmissionControl& admission, bool verbose = false);

    BotCore(const BotCore&) = delete;
    BotCore& operator=(const BotCore&) = delete;

    void handle_message(const InboundMessage& msg);

    // Admission gates in fixed order: global capacity, then the per-user
    // ceiling. On success the job is queued and its 1-based position in
    // line is returned; on rejection the user-facing reason.
    std::expected<size_t, std::string>
        submit(ChatId chat, MessageId source_message, const AudioDescriptor& audio,
               MessageId status_message);

    std::string queue_full_message() const;
    std::string user_limit_message(int in_queue) const;
    std::string welcome_message() const;
    std::string help_message() const;

private:
    void handle_audio(const InboundMessage& msg, const AudioDescriptor& audio);
    void reply(const InboundMessage& msg, const std::string& text);

    void log(const std::string& msg);

    const Config& config_;
    ChatTransport& transport_;
    JobQueue& queue_;
    AdmissionControl& admission_;
    bool verbose_;
};
