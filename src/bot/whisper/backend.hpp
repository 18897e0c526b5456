#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

inline constexpr uint32_t kModelSampleRate = 16000;

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// One speech model instance. Not safe for concurrent use: each worker owns
// its own instance.
class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    // Decodes the file to mono PCM at kModelSampleRate.
    virtual std::expected<std::vector<int16_t>, std::string>
        load_audio(const std::filesystem::path& file) = 0;

    // Blocking.
    virtual std::expected<TranscriptResult, std::string>
        transcribe(const std::filesystem::path& file) = 0;

    virtual std::string name() const = 0;
};
