#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "pipeline.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpRoot {
    std::filesystem::path path;

    TmpRoot() {
        path = std::filesystem::temp_directory_path() /
               ("tb_test_pipeline_" + std::to_string(getpid()));
        std::filesystem::create_directories(path);
    }

    ~TmpRoot() { std::filesystem::remove_all(path); }

    bool empty() const { return std::filesystem::is_empty(path); }
};

TranscriptionJob sample_job() {
    return TranscriptionJob{
        .chat_id = 12345,
        .source_message_id = 1,
        .source_id = "test_file_123",
        .resolved_file_name = "test_audio.ogg",
        .mime_type = "audio/ogg",
        .declared_size = 1024 * 1024,
        .status_message_id = 2,
    };
}

} // namespace

TEST_CASE("ProcessingPipeline", "[pipeline]") {
    TmpRoot root;
    FakeTransport transport;
    FakeModel model;
    PipelineSettings settings{.max_file_size = 20 * 1024 * 1024, .scratch_root = root.path.string()};
    ProcessingPipeline pipeline(settings, transport);
    auto job = sample_job();

    SECTION("SuccessfulTranscription") {
        auto result = pipeline.run(job, model);
        REQUIRE(result.ok);
        REQUIRE(result.outcome == PipelineOutcome::Transcribed);
        REQUIRE_FALSE(result.error);

        REQUIRE(transport.sent.size() == 1);
        REQUIRE(transport.sent[0].chat == 12345);
        REQUIRE(transport.sent[0].reply_to == 1);
        REQUIRE(transport.sent[0].text == "Transcription:\n\n Hello from the test.");

        REQUIRE(transport.edits.size() == 3);
        REQUIRE(transport.edits[0].text == "Downloading your audio file...");
        REQUIRE(transport.edits[1].text == "Analyzing audio duration...");
        REQUIRE(transport.edits[2].text == "Processing your audio. Estimated time: 2 seconds.");
        for (auto& e : transport.edits) REQUIRE(e.message == 2);
    }

    SECTION("ScratchRemovedAfterSuccess") {
        REQUIRE(pipeline.run(job, model).ok);
        REQUIRE(transport.fetch_dirs.size() == 1);
        REQUIRE_FALSE(std::filesystem::exists(transport.fetch_dirs[0]));
        REQUIRE(root.empty());
    }

    SECTION("OversizedJobSkipsNetwork") {
        job.declared_size = 25 * 1024 * 1024;
        auto result = pipeline.run(job, model);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error->kind == PipelineError::Kind::SizeExceeded);
        REQUIRE(transport.fetch_dirs.empty());
        REQUIRE(model.transcribe_calls.load() == 0);
        REQUIRE(transport.sent.size() == 1);
        REQUIRE(transport.sent[0].text == "File is too large. The limit is 20 MB.");
    }

    SECTION("EmptyAudioIsSuccess") {
        model.sample_count = 0;
        auto result = pipeline.run(job, model);
        REQUIRE(result.ok);
        REQUIRE(result.outcome == PipelineOutcome::EmptyAudio);
        REQUIRE(model.transcribe_calls.load() == 0);
        REQUIRE(transport.sent.size() == 1);
        REQUIRE(transport.sent[0].text == "The audio file appears to be empty or corrupted.");
        REQUIRE(root.empty());
    }

    SECTION("TooShortAudioIsSuccess") {
        model.sample_count = 1599; // just under 0.1 s
        auto result = pipeline.run(job, model);
        REQUIRE(result.ok);
        REQUIRE(result.outcome == PipelineOutcome::TooShort);
        REQUIRE(model.transcribe_calls.load() == 0);
        REQUIRE(transport.sent.size() == 1);
        REQUIRE(transport.sent[0].text ==
                "The audio file is too short to transcribe (less than 0.1 seconds).");
    }

    SECTION("MinimumDurationProceeds") {
        model.sample_count = 1600; // exactly 0.1 s
        auto result = pipeline.run(job, model);
        REQUIRE(result.ok);
        REQUIRE(result.outcome == PipelineOutcome::Transcribed);
        REQUIRE(model.transcribe_calls.load() == 1);
    }

    SECTION("BlankTranscriptionNoSpeech") {
        model.text = "  \n\t ";
        auto result = pipeline.run(job, model);
        REQUIRE(result.ok);
        REQUIRE(result.outcome == PipelineOutcome::NoSpeech);
        REQUIRE(transport.sent.size() == 1);
        REQUIRE(transport.sent[0].text == "The audio contained no detectable speech.");
    }

    SECTION("LongTranscriptionChunked") {
        model.text = std::string(9000, 'x');
        auto result = pipeline.run(job, model);
        REQUIRE(result.ok);
        REQUIRE(transport.sent.size() == 3);

        std::string rebuilt;
        for (auto& s : transport.sent) {
            REQUIRE(s.text.size() <= 4096);
            REQUIRE(s.text.starts_with("Transcription:\n\n"));
            REQUIRE(s.reply_to == 1);
            rebuilt += s.text.substr(16);
        }
        REQUIRE(rebuilt == model.text);
    }

    SECTION("TruncatedUtf8StillDelivered") {
        // Multi-byte character cut in half by the model
        model.text = "abc\xE2\x82";
        auto result = pipeline.run(job, model);
        REQUIRE(result.ok);
        REQUIRE(result.outcome == PipelineOutcome::Transcribed);

        REQUIRE(transport.sent.size() == 1);
        REQUIRE(transport.sent[0].text.starts_with("Transcription:\n\nabc"));

        auto body = nlohmann::json::parse(transport.bodies.back());
        REQUIRE(body["text"].get<std::string>() == "Transcription:\n\nabc\xEF\xBF\xBD");
    }

    SECTION("DownloadFailureClassified") {
        transport.fail_fetch = true;
        auto result = pipeline.run(job, model);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error->kind == PipelineError::Kind::DownloadFailure);
        REQUIRE(result.error->category == ErrorCategory::Download);
        REQUIRE(model.transcribe_calls.load() == 0);
        REQUIRE(transport.sent.size() == 1);
        REQUIRE(transport.sent[0].text == "Sorry, failed to download your file. Please try again.");
        REQUIRE(root.empty());
    }

    SECTION("DecodeFailureReported") {
        model.decode_error = "failed to load audio: Invalid data found when processing input";
        auto result = pipeline.run(job, model);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error->kind == PipelineError::Kind::DecodeFailure);
        REQUIRE(transport.sent.size() == 1);
        REQUIRE(transport.sent[0].text == "Sorry, an error occurred while processing your file.");
        REQUIRE(root.empty());
    }

    SECTION("InferenceFailureClassified") {
        model.transcribe_error = "whisper_full failed with code -3";
        auto result = pipeline.run(job, model);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error->kind == PipelineError::Kind::InferenceFailure);
        REQUIRE(result.error->category == ErrorCategory::Transcription);
        REQUIRE(transport.sent.size() == 1);
        REQUIRE(transport.sent[0].text ==
                "Sorry, failed to transcribe your audio. The file may be corrupted "
                "or in an unsupported format.");
        REQUIRE(root.empty());
    }

    SECTION("EmptyTensorClassified") {
        model.transcribe_error = "cannot reshape tensor of 0 elements into shape [1, 0]";
        auto result = pipeline.run(job, model);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error->category == ErrorCategory::UnprocessableAudio);
    }

    SECTION("InternalCauseNeverShown") {
        model.transcribe_error = "secret internal detail 0xdeadbeef";
        pipeline.run(job, model);
        REQUIRE(transport.sent.size() == 1);
        REQUIRE(transport.sent[0].text.find("0xdeadbeef") == std::string::npos);
    }

    SECTION("NotificationFailureSwallowed") {
        transport.fail_fetch = true;
        transport.fail_send = true;
        PipelineResult result;
        REQUIRE_NOTHROW(result = pipeline.run(job, model));
        REQUIRE_FALSE(result.ok);
        REQUIRE(transport.sent.empty());
    }

    SECTION("ScratchRemovedWhenModelThrows") {
        model.throw_on_transcribe = true;
        REQUIRE_THROWS(pipeline.run(job, model));
        REQUIRE(root.empty());
    }
}

TEST_CASE("Processing time estimate", "[pipeline]") {
    FakeTransport transport;
    ProcessingPipeline pipeline(PipelineSettings{.scratch_root = "/tmp"}, transport);

    REQUIRE(pipeline.estimate_processing_seconds(0.5) == 2.0);
    REQUIRE(pipeline.estimate_processing_seconds(60.0) == 13.0);
    REQUIRE(pipeline.estimate_processing_seconds(300.0) == 65.0);

    ProcessingPipeline slower(PipelineSettings{.seconds_per_audio_minute = 30.0, .scratch_root = "/tmp"},
                              transport);
    REQUIRE(slower.estimate_processing_seconds(120.0) == 60.0);
}
