#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "tb_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (::write(fd, content.data(), content.size()) < 0) path.clear();
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Sets an environment variable for the lifetime of the guard.
struct EnvGuard {
    std::string name;

    EnvGuard(std::string n, const char* value) : name(std::move(n)) {
        ::setenv(name.c_str(), value, 1);
    }
    ~EnvGuard() { ::unsetenv(name.c_str()); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.telegram.token.empty());
        REQUIRE(cfg.telegram.api_url == "https://api.telegram.org");
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.backend.model == "base");
        REQUIRE(cfg.limits.max_file_size == 20ull * 1024 * 1024);
        REQUIRE(cfg.limits.max_queue_size == 100);
        REQUIRE(cfg.limits.max_jobs_per_user == 3);
        REQUIRE(cfg.limits.num_workers == 2);
        REQUIRE(cfg.processing.seconds_per_audio_minute == 13.0);
        REQUIRE(cfg.processing.min_duration_s == 0.1);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "telegram": { "token": "123:abc", "api_url": "http://localhost:8081", "poll_timeout": 10 },
            "backend": {
                "type": "local",
                "url": "http://10.0.0.1:9090",
                "api_format": "openai",
                "language": "de",
                "model": "small",
                "models_dir": "/var/lib/whisper",
                "threads": 8
            },
            "limits": { "max_file_size": 1048576, "max_queue_size": 5, "max_jobs_per_user": 1, "workers": 4 },
            "processing": { "seconds_per_audio_minute": 20.5, "min_duration": 0.5, "scratch_dir": "/srv/tmp" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.telegram.token == "123:abc");
        REQUIRE(cfg.telegram.api_url == "http://localhost:8081");
        REQUIRE(cfg.telegram.poll_timeout_s == 10);
        REQUIRE(cfg.backend.type == "local");
        REQUIRE(cfg.backend.api_format == "openai");
        REQUIRE(cfg.backend.language == "de");
        REQUIRE(cfg.backend.model == "small");
        REQUIRE(cfg.backend.models_dir == "/var/lib/whisper");
        REQUIRE(cfg.backend.threads == 8);
        REQUIRE(cfg.limits.max_file_size == 1048576);
        REQUIRE(cfg.limits.max_queue_size == 5);
        REQUIRE(cfg.limits.max_jobs_per_user == 1);
        REQUIRE(cfg.limits.num_workers == 4);
        REQUIRE(cfg.processing.seconds_per_audio_minute == 20.5);
        REQUIRE(cfg.processing.min_duration_s == 0.5);
        REQUIRE(cfg.processing.scratch_dir == "/srv/tmp");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "limits": { "workers": 6 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.limits.num_workers == 6);
        REQUIRE(cfg.limits.max_queue_size == 100);
        REQUIRE(cfg.backend.url == "http://localhost:8080");
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("{ \"limits\": ");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.limits.num_workers == 2);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/tb_test_nonexistent_config_file.json");
        REQUIRE(cfg.backend.type == "lan");
    }
}

TEST_CASE("Config::apply_env", "[config]") {
    Config cfg;

    SECTION("EnvironmentOverridesFile") {
        EnvGuard token("TELEGRAM_BOT_TOKEN", "42:secret");
        EnvGuard workers("NUM_WORKERS", "8");
        EnvGuard size("MAX_FILE_SIZE", "1024");
        EnvGuard per_user("MAX_JOBS_PER_USER_IN_QUEUE", "5");
        EnvGuard model("WHISPER_MODEL", "medium");

        auto r = cfg.apply_env();
        REQUIRE(r.has_value());
        REQUIRE(cfg.telegram.token == "42:secret");
        REQUIRE(cfg.limits.num_workers == 8);
        REQUIRE(cfg.limits.max_file_size == 1024);
        REQUIRE(cfg.limits.max_jobs_per_user == 5);
        REQUIRE(cfg.backend.model == "medium");
        REQUIRE(cfg.limits.max_queue_size == 100);
    }

    SECTION("EmptyValueIgnored") {
        EnvGuard queue("MAX_QUEUE_SIZE", "");
        REQUIRE(cfg.apply_env().has_value());
        REQUIRE(cfg.limits.max_queue_size == 100);
    }

    SECTION("InvalidNumberRejected") {
        EnvGuard queue("MAX_QUEUE_SIZE", "12abc");
        auto r = cfg.apply_env();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error() == "MAX_QUEUE_SIZE: invalid number '12abc'");
    }

    SECTION("NegativeNumberRejected") {
        EnvGuard workers("NUM_WORKERS", "-1");
        REQUIRE_FALSE(cfg.apply_env().has_value());
    }
}
