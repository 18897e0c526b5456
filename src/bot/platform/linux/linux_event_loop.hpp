#pragma once

#include "admission_control.hpp"
#include "bot_core.hpp"
#include "config.hpp"
#include "job_queue.hpp"
#include "pipeline.hpp"
#include "telegram/telegram_client.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

// Main thread: epoll over a signalfd and an eventfd. A poller thread long
// polls Telegram and hands updates over through the eventfd; the worker
// pool consumes the job queue on its own threads.
class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void poll_updates(std::stop_token stop);
    void dispatch_pending();
    void shutdown();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    TelegramClient telegram_;
    JobQueue queue_;
    AdmissionControl admission_;
    ProcessingPipeline pipeline_;
    BotCore core_;
    WorkerPool workers_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int update_event_fd_ = -1;

    std::atomic<bool> running_{false};

    std::mutex pending_mutex_;
    std::vector<InboundMessage> pending_;
    std::jthread poller_;
};
