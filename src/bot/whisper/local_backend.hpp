#pragma once

#include "backend.hpp"

#include <memory>
#include <string>

struct whisper_context;

// whisper.cpp linked into the process. Each instance owns its own context,
// so instances may run on different threads at the same time.
class LocalWhisperBackend : public SpeechModel {
    struct Key {
        explicit Key() = default;
    };

public:
    static std::expected<std::unique_ptr<LocalWhisperBackend>, std::string>
        create(const std::string& model_path, std::string language = "auto", int threads = 4);

    // Only reachable through create().
    LocalWhisperBackend(Key, whisper_context* ctx, std::string model_path, std::string language,
                        int threads);
    ~LocalWhisperBackend() override;

    LocalWhisperBackend(const LocalWhisperBackend&) = delete;
    LocalWhisperBackend& operator=(const LocalWhisperBackend&) = delete;

    std::expected<std::vector<int16_t>, std::string>
        load_audio(const std::filesystem::path& file) override;

    std::expected<TranscriptResult, std::string>
        transcribe(const std::filesystem::path& file) override;

    std::string name() const override { return "local:" + model_path_; }

private:
    whisper_context* ctx_;
    std::string model_path_;
    std::string language_;
    int threads_;
};

// "base" -> "<models_dir>/ggml-base.bin"; anything that looks like a path
// is returned unchanged.
std::string resolve_model_path(const std::string& model, const std::string& models_dir);
