#pragma once

#include <cstdint>
#include <expected>
#include <string>

struct Config {
    struct Telegram {
        std::string token;
        std::string api_url = "https://api.telegram.org";
        uint32_t poll_timeout_s = 30;
    } telegram;

    struct Backend {
        std::string type = "lan";                    // "lan" or "local"
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp";      // "whisper.cpp" or "openai"
        std::string language = "auto";
        std::string model = "base";
        std::string models_dir = "models";
        uint32_t threads = 4;
    } backend;

    struct Limits {
        uint64_t max_file_size = 20ull * 1024 * 1024;
        uint32_t max_queue_size = 100;
        uint32_t max_jobs_per_user = 3;
        uint32_t num_workers = 2;
    } limits;

    struct Processing {
        double seconds_per_audio_minute = 13.0;
        double min_duration_s = 0.1;
        std::string scratch_dir;                     // empty: system temp dir
    } processing;

    static Config load(const std::string& path);
    static Config load_default();

    // Environment variables win over file values. Fails on malformed numbers.
    std::expected<void, std::string> apply_env();
};
