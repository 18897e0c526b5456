#pragma once

#include "backend.hpp"

#include <string>

// Talks to a whisper server on the network. Audio is decoded locally with
// ffmpeg and uploaded as 16 kHz WAV.
class LanBackend : public SpeechModel {
public:
    // api_format: "whisper.cpp" or "openai"
    LanBackend(std::string url, std::string api_format = "whisper.cpp",
               std::string language = "auto", std::string model = "base");

    std::expected<std::vector<int16_t>, std::string>
        load_audio(const std::filesystem::path& file) override;

    std::expected<TranscriptResult, std::string>
        transcribe(const std::filesystem::path& file) override;

    std::string name() const override { return "lan:" + url_; }

private:
    std::string url_;
    std::string api_format_;
    std::string language_;
    std::string model_;
};
