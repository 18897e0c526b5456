#pragma once

#include "error_classifier.hpp"
#include "job.hpp"
#include "platform/chat_transport.hpp"
#include "whisper/backend.hpp"

#include <cstdint>
#include <optional>
#include <string>

struct PipelineSettings {
    uint64_t max_file_size = 20ull * 1024 * 1024;
    double seconds_per_audio_minute = 13.0;
    double min_duration_s = 0.1;
    std::string scratch_root;
};

struct PipelineError {
    enum class Kind {
        SizeExceeded,
        DownloadFailure,
        DecodeFailure,
        InferenceFailure,
        DeliveryFailure,
        Unclassified,
    };

    Kind kind = Kind::Unclassified;
    std::string cause;                 // internal, logged only
    ErrorCategory category = ErrorCategory::Unclassified;
};

enum class PipelineOutcome { Transcribed, NoSpeech, EmptyAudio, TooShort, Failed };

struct PipelineResult {
    bool ok = false;
    PipelineOutcome outcome = PipelineOutcome::Failed;
    std::optional<PipelineError> error;
};

// Drives one job from download to delivery. Business failures come back as
// a PipelineResult with ok == false after the user has been told; only
// unexpected conditions escape as exceptions.
class ProcessingPipeline {
public:
    ProcessingPipeline(PipelineSettings settings, ChatTransport& transport, bool verbose = false);

    PipelineResult run(const TranscriptionJob& job, SpeechModel& model);

    // max(duration / 60 * seconds_per_audio_minute, 2)
    double estimate_processing_seconds(double audio_seconds) const;

    const PipelineSettings& settings() const { return settings_; }

private:
    void set_status(const TranscriptionJob& job, const std::string& text);
    void reply(const TranscriptionJob& job, const std::string& text);
    std::expected<void, std::string> deliver(const TranscriptionJob& job, const std::string& text);
    PipelineResult fail(const TranscriptionJob& job, PipelineError::Kind kind, std::string cause);

    void log(const std::string& msg);

    PipelineSettings settings_;
    ChatTransport& transport_;
    bool verbose_;
};
