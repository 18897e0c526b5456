#include "worker_pool.hpp"

#include <exception>
#include <format>
#include <print>

WorkerPool::WorkerPool(size_t num_workers, JobQueue& queue, AdmissionControl& admission,
                       ProcessingPipeline& pipeline, ChatTransport& transport,
                       ModelFactory factory, bool verbose)
    : queue_(queue), admission_(admission), pipeline_(pipeline), transport_(transport),
      factory_(std::move(factory)), verbose_(verbose), models_(num_workers) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (!threads_.empty()) return;

    threads_.reserve(models_.size());
    for (size_t i = 0; i < models_.size(); ++i) {
        threads_.emplace_back([this, i] { run(i); });
    }
    log(std::format("Started {} worker threads", models_.size()));
}

void WorkerPool::stop() {
    queue_.close();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::run(size_t index) {
    auto name = worker_name(index);

    auto model = create_model(index);
    if (!model || !*model) {
        std::println(stderr, "[transcribe-bot] {}: failed to load model: {}", name,
                     model ? std::string("factory returned no model") : model.error());
        return;
    }
    models_[index] = std::move(*model);
    SpeechModel& own_model = *models_[index];
    active_.fetch_add(1, std::memory_order_acq_rel);
    log(std::format("{} ready ({})", name, own_model.name()));

    while (auto job = queue_.get()) {
        log(std::format("{} picked up {} for chat {}", name, job->resolved_file_name, job->chat_id));

        try {
            auto result = pipeline_.run(*job, own_model);
            log(std::format("{} {} job for chat {}", name,
                            result.ok ? "completed" : "failed", job->chat_id));
        } catch (const std::exception& e) {
            std::println(stderr, "[transcribe-bot] {}: unexpected error on {} for chat {}: {}",
                         name, job->resolved_file_name, job->chat_id, e.what());
            notify_unexpected(*job);
        } catch (...) {
            std::println(stderr, "[transcribe-bot] {}: unknown exception on {} for chat {}",
                         name, job->resolved_file_name, job->chat_id);
            notify_unexpected(*job);
        }

        finish_job(*job);
    }

    active_.fetch_sub(1, std::memory_order_acq_rel);
    log(name + " stopped");
}

std::expected<std::unique_ptr<SpeechModel>, std::string>
WorkerPool::create_model(size_t index) {
    try {
        return factory_(index);
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    } catch (...) {
        return std::unexpected("unknown exception");
    }
}

void WorkerPool::notify_unexpected(const TranscriptionJob& job) {
    try {
        auto sent = transport_.send_message(job.chat_id,
                                            std::string(user_message(ErrorCategory::Unclassified)),
                                            job.source_message_id);
        if (!sent) {
            std::println(stderr, "[transcribe-bot] Failed to notify chat {}: {}", job.chat_id, sent.error());
        }
    } catch (const std::exception& e) {
        std::println(stderr, "[transcribe-bot] Failed to notify chat {}: {}", job.chat_id, e.what());
    }
}

void WorkerPool::finish_job(const TranscriptionJob& job) {
    // The status message may already be gone.
    try {
        auto deleted = transport_.delete_message(job.chat_id, job.status_message_id);
        if (!deleted) {
            log(std::format("Could not delete status message {} in chat {}: {}",
                            job.status_message_id, job.chat_id, deleted.error()));
        }
    } catch (const std::exception& e) {
        log(std::format("Could not delete status message {} in chat {}: {}",
                        job.status_message_id, job.chat_id, e.what()));
    }

    admission_.release(job.chat_id);
    processed_.fetch_add(1, std::memory_order_acq_rel);
}

std::string WorkerPool::worker_name(size_t index) const {
    return std::format("Worker-{}", index + 1);
}

void WorkerPool::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[transcribe-bot] {}", msg);
    }
}
