#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace audio {

// Decodes any container/codec ffmpeg understands to mono signed 16-bit PCM
// at sample_rate. Runs the ffmpeg binary found in PATH (or ffmpeg_bin).
std::expected<std::vector<int16_t>, std::string>
decode_file(const std::filesystem::path& file, uint32_t sample_rate,
            const std::string& ffmpeg_bin = "ffmpeg");

// int16 PCM to the [-1, 1] float range whisper.cpp consumes.
std::vector<float> to_float(const std::vector<int16_t>& samples);

} // namespace audio
