#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <charconv>
#include <format>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
std::expected<void, std::string> env_number(const char* name, T& out) {
    const char* val = std::getenv(name);
    if (!val || !*val) return {};

    std::string_view sv(val);
    T parsed{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), parsed);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return std::unexpected(std::format("{}: invalid number '{}'", name, sv));
    }
    out = parsed;
    return {};
}

void env_string(const char* name, std::string& out) {
    const char* val = std::getenv(name);
    if (val && *val) out = val;
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("telegram")) {
            auto& t = j["telegram"];
            if (t.contains("token")) cfg.telegram.token = t["token"].get<std::string>();
            if (t.contains("api_url")) cfg.telegram.api_url = t["api_url"].get<std::string>();
            if (t.contains("poll_timeout")) cfg.telegram.poll_timeout_s = t["poll_timeout"].get<uint32_t>();
        }

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
            if (b.contains("language")) cfg.backend.language = b["language"].get<std::string>();
            if (b.contains("model")) cfg.backend.model = b["model"].get<std::string>();
            if (b.contains("models_dir")) cfg.backend.models_dir = b["models_dir"].get<std::string>();
            if (b.contains("threads")) cfg.backend.threads = b["threads"].get<uint32_t>();
        }

        if (j.contains("limits")) {
            auto& l = j["limits"];
            if (l.contains("max_file_size")) cfg.limits.max_file_size = l["max_file_size"].get<uint64_t>();
            if (l.contains("max_queue_size")) cfg.limits.max_queue_size = l["max_queue_size"].get<uint32_t>();
            if (l.contains("max_jobs_per_user")) cfg.limits.max_jobs_per_user = l["max_jobs_per_user"].get<uint32_t>();
            if (l.contains("workers")) cfg.limits.num_workers = l["workers"].get<uint32_t>();
        }

        if (j.contains("processing")) {
            auto& p = j["processing"];
            if (p.contains("seconds_per_audio_minute"))
                cfg.processing.seconds_per_audio_minute = p["seconds_per_audio_minute"].get<double>();
            if (p.contains("min_duration")) cfg.processing.min_duration_s = p["min_duration"].get<double>();
            if (p.contains("scratch_dir")) cfg.processing.scratch_dir = p["scratch_dir"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

std::expected<void, std::string> Config::apply_env() {
    env_string("TELEGRAM_BOT_TOKEN", telegram.token);
    env_string("TELEGRAM_API_URL", telegram.api_url);
    env_string("WHISPER_MODEL", backend.model);
    env_string("WHISPER_BACKEND", backend.type);
    env_string("WHISPER_URL", backend.url);

    if (auto r = env_number("NUM_WORKERS", limits.num_workers); !r) return r;
    if (auto r = env_number("MAX_FILE_SIZE", limits.max_file_size); !r) return r;
    if (auto r = env_number("MAX_QUEUE_SIZE", limits.max_queue_size); !r) return r;
    if (auto r = env_number("MAX_JOBS_PER_USER_IN_QUEUE", limits.max_jobs_per_user); !r) return r;
    return {};
}
