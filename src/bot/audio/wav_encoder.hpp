#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// In-memory WAV container for mono PCM16, as accepted by whisper servers.
namespace wav {

inline constexpr size_t kHeaderSize = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    const uint32_t data_size = static_cast<uint32_t>(samples.size_bytes());

    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + data_size);

    auto put_tag = [&out](const char (&tag)[5]) { out.insert(out.end(), tag, tag + 4); };
    auto put_le = [&out](uint32_t v, int bytes) {
        for (int i = 0; i < bytes; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    };

    put_tag("RIFF");
    put_le(36 + data_size, 4);
    put_tag("WAVE");
    put_tag("fmt ");
    put_le(16, 4);                                        // fmt chunk size
    put_le(1, 2);                                         // PCM
    put_le(channels, 2);
    put_le(sample_rate, 4);
    put_le(sample_rate * channels * bits_per_sample / 8, 4);
    put_le(channels * bits_per_sample / 8, 2);
    put_le(bits_per_sample, 2);
    put_tag("data");
    put_le(data_size, 4);

    out.resize(kHeaderSize + data_size);
    if (data_size > 0) std::memcpy(out.data() + kHeaderSize, samples.data(), data_size);
    return out;
}

} // namespace wav
