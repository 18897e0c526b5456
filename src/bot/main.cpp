#include "config.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <curl/curl.h>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: transcribe-bot [options]");
            std::println("Options:");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            std::println("Environment: TELEGRAM_BOT_TOKEN, WHISPER_BACKEND, WHISPER_URL, WHISPER_MODEL,");
            std::println("  NUM_WORKERS, MAX_FILE_SIZE, MAX_QUEUE_SIZE, MAX_JOBS_PER_USER_IN_QUEUE");
            return 0;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    if (auto env = config.apply_env(); !env) {
        std::println(stderr, "config: {}", env.error());
        return 1;
    }

    if (verbose) {
        std::println(stderr, "[transcribe-bot] Starting (backend: {} @ {}, model {})",
                     config.backend.type, config.backend.url, config.backend.model);
    }

    // Once per process, before any thread touches curl
    curl_global_init(CURL_GLOBAL_DEFAULT);

    int rc = 0;
    {
        LinuxEventLoop loop(std::move(config), verbose);
        if (!loop.init()) {
            std::println(stderr, "Failed to initialize event loop");
            rc = 1;
        } else {
            loop.run();
        }
    }

    curl_global_cleanup();
    return rc;
}
