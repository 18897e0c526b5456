#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/transcribe-bot";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/transcribe-bot";
}

std::string scratch_root() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) return "/tmp";
    return tmp.string();
}

} // namespace platform
