#include "scratch_dir.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <stdlib.h>
#include <vector>

namespace fs = std::filesystem;

std::expected<ScratchDir, std::string>
ScratchDir::create(const fs::path& root, const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(root, ec);

    // mkdtemp needs a mutable char*
    std::string tmpl_str = (root / (prefix + "XXXXXX")).string();
    std::vector<char> tmpl(tmpl_str.begin(), tmpl_str.end());
    tmpl.push_back('\0');

    if (!::mkdtemp(tmpl.data())) {
        return std::unexpected("mkdtemp(" + tmpl_str + ") failed: " + std::strerror(errno));
    }
    return ScratchDir(fs::path(tmpl.data()));
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScratchDir::~ScratchDir() {
    remove();
}

void ScratchDir::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::println(stderr, "scratch: failed to remove {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}
