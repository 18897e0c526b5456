#include "admission_control.hpp"

#include <format>

std::string format_size(uint64_t bytes) {
    constexpr uint64_t kib = 1024;
    constexpr uint64_t mib = kib * 1024;
    constexpr uint64_t gib = mib * 1024;

    auto fmt = [](uint64_t value, uint64_t unit, const char* suffix) {
        if (value % unit == 0) return std::format("{} {}", value / unit, suffix);
        return std::format("{:.1f} {}", static_cast<double>(value) / unit, suffix);
    };

    if (bytes >= gib) return fmt(bytes, gib, "GB");
    if (bytes >= mib) return fmt(bytes, mib, "MB");
    if (bytes >= kib) return fmt(bytes, kib, "KB");
    return std::format("{} bytes", bytes);
}

AdmissionControl::AdmissionControl(uint64_t max_file_size, uint32_t max_jobs_per_user)
    : max_file_size_(max_file_size), max_jobs_per_user_(max_jobs_per_user) {}

std::expected<void, std::string>
AdmissionControl::validate_size(const AudioDescriptor& audio) const {
    return validate_size(audio.declared_size);
}

std::expected<void, std::string>
AdmissionControl::validate_size(uint64_t declared_size) const {
    if (declared_size > max_file_size_) {
        return std::unexpected(size_limit_message());
    }
    return {};
}

std::string AdmissionControl::size_limit_message() const {
    return std::format("File is too large. The limit is {}.", format_size(max_file_size_));
}

bool AdmissionControl::try_admit(ChatId user) {
    std::scoped_lock lock(mutex_);
    auto it = counts_.find(user);
    int current = it == counts_.end() ? 0 : it->second;
    if (current >= static_cast<int>(max_jobs_per_user_)) {
        return false;
    }
    if (it == counts_.end()) {
        counts_.emplace(user, 1);
    } else {
        ++it->second;
    }
    return true;
}

void AdmissionControl::release(ChatId user) {
    std::scoped_lock lock(mutex_);
    auto it = counts_.find(user);
    if (it == counts_.end()) return;
    if (--it->second <= 0) {
        counts_.erase(it);
    }
}

int AdmissionControl::count_for(ChatId user) const {
    std::scoped_lock lock(mutex_);
    auto it = counts_.find(user);
    return it == counts_.end() ? 0 : it->second;
}

size_t AdmissionControl::tracked_users() const {
    std::scoped_lock lock(mutex_);
    return counts_.size();
}
