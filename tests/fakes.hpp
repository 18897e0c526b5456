#pragma once

#include "platform/chat_transport.hpp"
#include "telegram/telegram_client.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// In-memory chat service that records every call.
class FakeTransport : public ChatTransport {
public:
    struct Sent {
        ChatId chat;
        std::string text;
        std::optional<MessageId> reply_to;
    };
    struct Edit {
        ChatId chat;
        MessageId message;
        std::string text;
    };

    std::expected<std::filesystem::path, std::string>
    fetch_file(const std::string& source_id, const std::filesystem::path& dest_dir) override {
        std::scoped_lock lock(mutex_);
        fetch_dirs.push_back(dest_dir);
        if (fail_fetch) return std::unexpected("file download failed: HTTP 404");
        auto path = dest_dir / (source_id + ".ogg");
        std::ofstream(path) << "fake audio";
        return path;
    }

    std::expected<MessageId, std::string>
    send_message(ChatId chat, const std::string& text, std::optional<MessageId> reply_to) override {
        std::scoped_lock lock(mutex_);
        if (fail_send) return std::unexpected("sendMessage: Forbidden: bot was blocked by the user");
        // Same wire encoding as the Bot API client
        nlohmann::json params = {{"chat_id", chat}, {"text", text}};
        if (reply_to) params["reply_to_message_id"] = *reply_to;
        bodies.push_back(encode_request(params));
        sent.push_back({chat, text, reply_to});
        return next_id_++;
    }

    std::expected<void, std::string>
    edit_message(ChatId chat, MessageId message, const std::string& text) override {
        std::scoped_lock lock(mutex_);
        edits.push_back({chat, message, text});
        return {};
    }

    std::expected<void, std::string> delete_message(ChatId chat, MessageId message) override {
        std::scoped_lock lock(mutex_);
        deleted.emplace_back(chat, message);
        if (fail_delete) return std::unexpected("deleteMessage: message to delete not found");
        return {};
    }

    std::vector<Sent> sent_snapshot() {
        std::scoped_lock lock(mutex_);
        return sent;
    }

    size_t deleted_count() {
        std::scoped_lock lock(mutex_);
        return deleted.size();
    }

    bool fail_fetch = false;
    bool fail_send = false;
    bool fail_delete = false;

    std::vector<Sent> sent;
    std::vector<std::string> bodies;
    std::vector<Edit> edits;
    std::vector<std::pair<ChatId, MessageId>> deleted;
    std::vector<std::filesystem::path> fetch_dirs;

private:
    std::mutex mutex_;
    MessageId next_id_ = 1000;
};

// Scripted speech model. Counts overlapping transcribe() calls on the same
// instance so tests can prove a model is never shared.
class FakeModel : public SpeechModel {
public:
    explicit FakeModel(int id = 0) : id_(id) {}

    std::expected<std::vector<int16_t>, std::string>
    load_audio(const std::filesystem::path& file) override {
        last_file = file;
        if (decode_error) return std::unexpected(*decode_error);
        return std::vector<int16_t>(sample_count, 100);
    }

    std::expected<TranscriptResult, std::string>
    transcribe(const std::filesystem::path& file) override {
        if (in_flight_.fetch_add(1) != 0) overlapped = true;
        last_file = file;
        transcribe_calls.fetch_add(1);
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        in_flight_.fetch_sub(1);

        if (throw_on_transcribe) throw std::runtime_error("model state corrupted");
        if (throw_non_standard) throw 42;
        if (transcribe_error) return std::unexpected(*transcribe_error);
        return TranscriptResult{.text = text, .duration_s = 1.0, .processing_s = 0.1};
    }

    std::string name() const override { return "fake-" + std::to_string(id_); }
    int id() const { return id_; }

    size_t sample_count = 16000 * 5;
    std::string text = " Hello from the test.";
    std::optional<std::string> decode_error;
    std::optional<std::string> transcribe_error;
    bool throw_on_transcribe = false;
    bool throw_non_standard = false;
    std::chrono::milliseconds delay{0};

    std::filesystem::path last_file;
    std::atomic<int> transcribe_calls{0};
    std::atomic<bool> overlapped{false};

private:
    int id_;
    std::atomic<int> in_flight_{0};
};
