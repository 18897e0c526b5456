#include "local_backend.hpp"

#include "audio/ffmpeg_decoder.hpp"

#include <chrono>
#include <whisper.h>

std::expected<std::unique_ptr<LocalWhisperBackend>, std::string>
LocalWhisperBackend::create(const std::string& model_path, std::string language, int threads) {
    whisper_context_params cparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected("failed to load whisper model " + model_path);
    }
    return std::make_unique<LocalWhisperBackend>(Key{}, ctx, model_path, std::move(language),
                                                 threads);
}

LocalWhisperBackend::LocalWhisperBackend(Key, whisper_context* ctx, std::string model_path,
                                         std::string language, int threads)
    : ctx_(ctx), model_path_(std::move(model_path)), language_(std::move(language)),
      threads_(threads) {}

LocalWhisperBackend::~LocalWhisperBackend() {
    whisper_free(ctx_);
}

std::expected<std::vector<int16_t>, std::string>
LocalWhisperBackend::load_audio(const std::filesystem::path& file) {
    return audio::decode_file(file, WHISPER_SAMPLE_RATE);
}

std::expected<TranscriptResult, std::string>
LocalWhisperBackend::transcribe(const std::filesystem::path& file) {
    auto samples = load_audio(file);
    if (!samples) {
        return std::unexpected(samples.error());
    }
    if (samples->empty()) {
        return std::unexpected("cannot transcribe empty audio");
    }

    auto pcmf32 = audio::to_float(*samples);
    double duration_s = static_cast<double>(pcmf32.size()) / WHISPER_SAMPLE_RATE;

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.translate = false;
    wparams.n_threads = threads_;
    wparams.language = language_.c_str();

    auto start = std::chrono::steady_clock::now();

    int ret = whisper_full(ctx_, wparams, pcmf32.data(), static_cast<int>(pcmf32.size()));
    if (ret != 0) {
        return std::unexpected("whisper_full failed with code " + std::to_string(ret));
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* seg = whisper_full_get_segment_text(ctx_, i);
        if (seg) text += seg;
    }

    auto end = std::chrono::steady_clock::now();
    return TranscriptResult{
        .text = std::move(text),
        .duration_s = duration_s,
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };
}

std::string resolve_model_path(const std::string& model, const std::string& models_dir) {
    if (model.find('/') != std::string::npos || model.ends_with(".bin")) {
        return model;
    }
    return models_dir + "/ggml-" + model + ".bin";
}
