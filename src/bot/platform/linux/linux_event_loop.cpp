#include "platform/linux/linux_event_loop.hpp"

#include "whisper/backend_factory.hpp"

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

constexpr auto kPollRetryDelay = std::chrono::seconds(5);

PipelineSettings pipeline_settings(const Config& config) {
    return PipelineSettings{
        .max_file_size = config.limits.max_file_size,
        .seconds_per_audio_minute = config.processing.seconds_per_audio_minute,
        .min_duration_s = config.processing.min_duration_s,
        .scratch_root = config.processing.scratch_dir,
    };
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      telegram_(config_.telegram.token, config_.telegram.api_url, config_.telegram.poll_timeout_s),
      queue_(config_.limits.max_queue_size),
      admission_(config_.limits.max_file_size, config_.limits.max_jobs_per_user),
      pipeline_(pipeline_settings(config_), telegram_, verbose_),
      core_(config_, telegram_, queue_, admission_, verbose_),
      workers_(config_.limits.num_workers, queue_, admission_, pipeline_, telegram_,
               // ModelFactory: one instance per worker
               [this](size_t) { return make_speech_model(config_.backend); },
               verbose_) {}

LinuxEventLoop::~LinuxEventLoop() {
    shutdown();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (update_event_fd_ >= 0) ::close(update_event_fd_);
}

bool LinuxEventLoop::init() {
    if (config_.telegram.token.empty()) {
        std::println(stderr, "TELEGRAM_BOT_TOKEN environment variable not set");
        return false;
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Block before any thread starts so every thread inherits the mask
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    update_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (update_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(update_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    workers_.start();
    poller_ = std::jthread([this](std::stop_token stop) { poll_updates(stop); });

    log(std::format("Bot started: {} workers, backend {} @ {}, queue capacity {}",
                    config_.limits.num_workers, config_.backend.type, config_.backend.url,
                    queue_.capacity()));

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == update_event_fd_) {
                uint64_t val;
                ::read(update_event_fd_, &val, sizeof(val));
                dispatch_pending();
            }
        }
    }

    shutdown();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::poll_updates(std::stop_token stop) {
    int64_t offset = 0;
    std::mutex wait_mutex;
    std::condition_variable_any wait_cv;

    while (!stop.stop_requested()) {
        auto updates = telegram_.get_updates(offset, stop);
        if (!updates) {
            if (stop.stop_requested()) break;
            std::println(stderr, "[transcribe-bot] getUpdates failed: {}", updates.error());
            std::unique_lock lock(wait_mutex);
            wait_cv.wait_for(lock, stop, kPollRetryDelay, [] { return false; });
            continue;
        }
        if (updates->empty()) continue;

        offset = next_offset(*updates, offset);

        {
            std::scoped_lock lock(pending_mutex_);
            for (auto& u : *updates) {
                if (u.message) pending_.push_back(std::move(*u.message));
            }
        }

        uint64_t val = 1;
        ::write(update_event_fd_, &val, sizeof(val));
    }
}

void LinuxEventLoop::dispatch_pending() {
    std::vector<InboundMessage> batch;
    {
        std::scoped_lock lock(pending_mutex_);
        batch.swap(pending_);
    }
    for (const auto& msg : batch) {
        core_.handle_message(msg);
    }
}

void LinuxEventLoop::shutdown() {
    if (poller_.joinable()) {
        poller_.request_stop();
        poller_.join();
    }
    workers_.stop();
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[transcribe-bot] {}", msg);
    }
}
