#include "common/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/toolsock";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/toolsock";
}

std::string socket_path(const std::string& dir) {
    return (fs::path(dir) / SOCKET_NAME).string();
}

std::string pid_path(const std::string& dir) {
    return (fs::path(dir) / PID_NAME).string();
}

std::string log_path(const std::string& dir) {
    return (fs::path(dir) / LOG_NAME).string();
}

std::string pid_path_for_socket(const std::string& socket_path) {
    return (fs::path(socket_path).parent_path() / PID_NAME).string();
}

} // namespace platform
