#include "bot_core.hpp"

#include "job.hpp"

#include <format>
#include <print>

namespace {

constexpr const char* kMsgQueueing = "Queueing your audio file...";

// "/help" and "/help@SomeBot" both count.
bool is_command(const std::string& text, std::string_view command) {
    if (!text.starts_with(command)) return false;
    if (text.size() == command.size()) return true;
    char next = text[command.size()];
    return next == ' ' || next == '@' || next == '\n';
}

} // namespace

BotCore::BotCore(const Config& config, ChatTransport& transport, JobQueue& queue,
                 AdmissionControl& admission, bool verbose)
    : config_(config), transport_(transport), queue_(queue), admission_(admission),
      verbose_(verbose) {}

void BotCore::handle_message(const InboundMessage& msg) {
    if (msg.audio) {
        handle_audio(msg, *msg.audio);
        return;
    }

    if (is_command(msg.text, "/start")) {
        reply(msg, welcome_message());
    } else if (is_command(msg.text, "/help")) {
        reply(msg, help_message());
    }
}

void BotCore::handle_audio(const InboundMessage& msg, const AudioDescriptor& audio) {
    if (auto valid = admission_.validate_size(audio); !valid) {
        log(std::format("Rejected {} byte file from chat {}", audio.declared_size, msg.chat_id));
        reply(msg, valid.error());
        return;
    }

    auto status = transport_.send_message(msg.chat_id, kMsgQueueing, msg.message_id);
    if (!status) {
        std::println(stderr, "[transcribe-bot] Could not acknowledge chat {}: {}",
                     msg.chat_id, status.error());
        return;
    }

    auto queued = submit(msg.chat_id, msg.message_id, audio, *status);
    std::string text = queued
        ? std::format("Your file has been queued for processing. Position: {}", *queued)
        : queued.error();

    auto edited = transport_.edit_message(msg.chat_id, *status, text);
    if (!edited) {
        log(std::format("Status update for chat {} failed: {}", msg.chat_id, edited.error()));
    }
}

std::expected<size_t, std::string>
BotCore::submit(ChatId chat, MessageId source_message, const AudioDescriptor& audio,
                MessageId status_message) {
    if (queue_.full()) {
        log(std::format("Queue full, rejecting job for chat {}", chat));
        return std::unexpected(queue_full_message());
    }

    if (!admission_.try_admit(chat)) {
        log(std::format("Chat {} is at its limit of {} jobs", chat, admission_.max_jobs_per_user()));
        return std::unexpected(user_limit_message(admission_.count_for(chat)));
    }

    auto job = make_job(audio, chat, source_message, status_message);
    auto file_name = job.resolved_file_name;
    if (!queue_.try_put(std::move(job))) {
        admission_.release(chat);
        return std::unexpected(queue_full_message());
    }

    size_t position = queue_.size();
    log(std::format("Queued {} for chat {}. Queue size: {}", file_name, chat, position));
    return position;
}

std::string BotCore::queue_full_message() const {
    return std::format("Sorry, the processing queue is full ({} files). Please try again later.",
                       queue_.capacity());
}

std::string BotCore::user_limit_message(int in_queue) const {
    return std::format("You have reached the maximum limit of {} audio files in the queue. "
                       "Currently in queue: {}. Please wait for them to finish before sending more.",
                       admission_.max_jobs_per_user(), in_queue);
}

std::string BotCore::welcome_message() const {
    return std::format("Hi! Send me a voice message or audio file (up to {}), "
                       "and I'll transcribe it for you.",
                       format_size(admission_.max_file_size()));
}

std::string BotCore::help_message() const {
    return std::format("Send me any voice message or audio file, and I'll convert it to text. "
                       "I can process up to {} files at the same time. "
                       "If the queue is full, please wait.",
                       config_.limits.num_workers);
}

void BotCore::reply(const InboundMessage& msg, const std::string& text) {
    auto res = transport_.send_message(msg.chat_id, text, msg.message_id);
    if (!res) {
        std::println(stderr, "[transcribe-bot] Failed to reply to chat {}: {}", msg.chat_id, res.error());
    }
}

void BotCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[transcribe-bot] {}", msg);
    }
}
