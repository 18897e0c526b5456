#pragma once

#include "audio_descriptor.hpp"
#include "job.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>
#include <unordered_map>

// "20 MB", "2 GB", "512 KB": binary units, whole numbers where exact.
std::string format_size(uint64_t bytes);

// Size validation plus a per-user ceiling on admitted (queued or in-flight)
// jobs. Every counter operation is a single critical section.
class AdmissionControl {
public:
    AdmissionControl(uint64_t max_file_size, uint32_t max_jobs_per_user);

    AdmissionControl(const AdmissionControl&) = delete;
    AdmissionControl& operator=(const AdmissionControl&) = delete;

    std::expected<void, std::string> validate_size(const AudioDescriptor& audio) const;
    std::expected<void, std::string> validate_size(uint64_t declared_size) const;
    std::string size_limit_message() const;

    // Reserves a slot for user if below the ceiling. No mutation on failure.
    bool try_admit(ChatId user);
    // Gives a slot back. Floors at zero and forgets users with no jobs.
    void release(ChatId user);

    int count_for(ChatId user) const;
    size_t tracked_users() const;

    uint64_t max_file_size() const { return max_file_size_; }
    uint32_t max_jobs_per_user() const { return max_jobs_per_user_; }

private:
    uint64_t max_file_size_;
    uint32_t max_jobs_per_user_;

    mutable std::mutex mutex_;
    std::unordered_map<ChatId, int> counts_;
};
