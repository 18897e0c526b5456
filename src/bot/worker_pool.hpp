#pragma once

#include "admission_control.hpp"
#include "job_queue.hpp"
#include "pipeline.hpp"
#include "platform/chat_transport.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Fixed set of consumer threads. Worker i creates and exclusively uses
// models_[i]; a worker whose model cannot be created exits immediately.
class WorkerPool {
public:
    using ModelFactory =
        std::function<std::expected<std::unique_ptr<SpeechModel>, std::string>(size_t worker)>;

    WorkerPool(size_t num_workers, JobQueue& queue, AdmissionControl& admission,
               ProcessingPipeline& pipeline, ChatTransport& transport,
               ModelFactory factory, bool verbose = false);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();
    // Closes the queue and joins every worker once the queue has drained.
    void stop();

    size_t size() const { return models_.size(); }
    size_t active_workers() const { return active_.load(std::memory_order_acquire); }
    size_t jobs_processed() const { return processed_.load(std::memory_order_acquire); }

private:
    void run(size_t index);
    // Runs the factory; a throwing factory counts as a failed model load.
    std::expected<std::unique_ptr<SpeechModel>, std::string> create_model(size_t index);
    void notify_unexpected(const TranscriptionJob& job);
    void finish_job(const TranscriptionJob& job);
    std::string worker_name(size_t index) const;

    void log(const std::string& msg);

    JobQueue& queue_;
    AdmissionControl& admission_;
    ProcessingPipeline& pipeline_;
    ChatTransport& transport_;
    ModelFactory factory_;
    bool verbose_;

    std::vector<std::unique_ptr<SpeechModel>> models_;
    std::vector<std::jthread> threads_;
    std::atomic<size_t> active_{0};
    std::atomic<size_t> processed_{0};
};
