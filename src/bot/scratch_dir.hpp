#pragma once

#include <expected>
#include <filesystem>
#include <string>

// Private temporary directory, removed with its contents on destruction.
class ScratchDir {
public:
    static std::expected<ScratchDir, std::string>
        create(const std::filesystem::path& root, const std::string& prefix = "transcribe-");

    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    explicit ScratchDir(std::filesystem::path path) : path_(std::move(path)) {}
    void remove();

    std::filesystem::path path_;
};
