#include "pipeline.hpp"

#include "admission_control.hpp"
#include "message_chunker.hpp"
#include "platform/platform_paths.hpp"
#include "scratch_dir.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace {

constexpr const char* kMsgDownloading = "Downloading your audio file...";
constexpr const char* kMsgAnalyzing = "Analyzing audio duration...";
constexpr const char* kMsgEmptyAudio = "The audio file appears to be empty or corrupted.";
constexpr const char* kMsgNoSpeech = "The audio contained no detectable speech.";

constexpr double kMinEstimateSeconds = 2.0;

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
}

} // namespace

ProcessingPipeline::ProcessingPipeline(PipelineSettings settings, ChatTransport& transport,
                                       bool verbose)
    : settings_(std::move(settings)), transport_(transport), verbose_(verbose) {
    if (settings_.scratch_root.empty()) {
        settings_.scratch_root = platform::scratch_root();
    }
}

double ProcessingPipeline::estimate_processing_seconds(double audio_seconds) const {
    return std::max(audio_seconds / 60.0 * settings_.seconds_per_audio_minute, kMinEstimateSeconds);
}

PipelineResult ProcessingPipeline::run(const TranscriptionJob& job, SpeechModel& model) {
    // The declared size comes from the client and may be stale.
    if (job.declared_size > settings_.max_file_size) {
        log(std::format("Rejecting {} for chat {}: declared size {} over limit",
                        job.resolved_file_name, job.chat_id, job.declared_size));
        reply(job, std::format("File is too large. The limit is {}.",
                               format_size(settings_.max_file_size)));
        return PipelineResult{
            .ok = false,
            .outcome = PipelineOutcome::Failed,
            .error = PipelineError{.kind = PipelineError::Kind::SizeExceeded,
                                   .cause = "declared size over limit",
                                   .category = ErrorCategory::Unclassified},
        };
    }

    set_status(job, kMsgDownloading);

    std::string text;
    {
        auto scratch = ScratchDir::create(settings_.scratch_root);
        if (!scratch) {
            return fail(job, PipelineError::Kind::Unclassified, scratch.error());
        }

        log("Downloading " + job.resolved_file_name);
        auto local = transport_.fetch_file(job.source_id, scratch->path());
        if (!local) {
            return fail(job, PipelineError::Kind::DownloadFailure,
                        "download failed: " + local.error());
        }
        log("Finished downloading " + job.resolved_file_name);

        set_status(job, kMsgAnalyzing);

        auto samples = model.load_audio(*local);
        if (!samples) {
            return fail(job, PipelineError::Kind::DecodeFailure, samples.error());
        }

        if (samples->empty()) {
            log("Empty audio file: " + job.resolved_file_name);
            reply(job, kMsgEmptyAudio);
            return PipelineResult{.ok = true, .outcome = PipelineOutcome::EmptyAudio};
        }

        double duration = static_cast<double>(samples->size()) / kModelSampleRate;
        if (duration < settings_.min_duration_s) {
            log(std::format("Very short audio file ({:.2f}s): {}", duration, job.resolved_file_name));
            reply(job, std::format("The audio file is too short to transcribe (less than {} seconds).",
                                   settings_.min_duration_s));
            return PipelineResult{.ok = true, .outcome = PipelineOutcome::TooShort};
        }

        set_status(job, std::format("Processing your audio. Estimated time: {:.0f} seconds.",
                                    estimate_processing_seconds(duration)));

        log(std::format("Starting transcription for {} (duration: {:.2f}s) on {}",
                        job.resolved_file_name, duration, model.name()));
        auto result = model.transcribe(*local);
        if (!result) {
            return fail(job, PipelineError::Kind::InferenceFailure,
                        "transcribe failed: " + result.error());
        }
        log(std::format("Finished transcription for {} in {:.1f}s",
                        job.resolved_file_name, result->processing_s));
        text = std::move(result->text);
    }

    if (is_blank(text)) {
        reply(job, kMsgNoSpeech);
        return PipelineResult{.ok = true, .outcome = PipelineOutcome::NoSpeech};
    }

    if (auto sent = deliver(job, text); !sent) {
        return fail(job, PipelineError::Kind::DeliveryFailure, "delivery failed: " + sent.error());
    }
    return PipelineResult{.ok = true, .outcome = PipelineOutcome::Transcribed};
}

std::expected<void, std::string>
ProcessingPipeline::deliver(const TranscriptionJob& job, const std::string& text) {
    auto chunks = split_for_messages(text, kTranscriptionHeader, kMessageSizeLimit);
    for (const auto& chunk : chunks) {
        auto sent = transport_.send_message(job.chat_id,
                                            std::string(kTranscriptionHeader) + chunk,
                                            job.source_message_id);
        if (!sent) {
            return std::unexpected(sent.error());
        }
    }
    return {};
}

void ProcessingPipeline::set_status(const TranscriptionJob& job, const std::string& text) {
    auto res = transport_.edit_message(job.chat_id, job.status_message_id, text);
    if (!res) {
        log(std::format("Status update for chat {} failed: {}", job.chat_id, res.error()));
    }
}

void ProcessingPipeline::reply(const TranscriptionJob& job, const std::string& text) {
    auto res = transport_.send_message(job.chat_id, text, job.source_message_id);
    if (!res) {
        std::println(stderr, "[transcribe-bot] Failed to notify chat {}: {}", job.chat_id, res.error());
    }
}

PipelineResult ProcessingPipeline::fail(const TranscriptionJob& job, PipelineError::Kind kind,
                                        std::string cause) {
    std::println(stderr, "[transcribe-bot] Failed processing {} for chat {}: {}",
                 job.resolved_file_name, job.chat_id, cause);

    auto category = classify_error(cause);
    reply(job, std::string(user_message(category)));

    return PipelineResult{
        .ok = false,
        .outcome = PipelineOutcome::Failed,
        .error = PipelineError{.kind = kind, .cause = std::move(cause), .category = category},
    };
}

void ProcessingPipeline::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[transcribe-bot] {}", msg);
    }
}
