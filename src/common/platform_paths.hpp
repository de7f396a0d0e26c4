#pragma once

#include <string>

namespace platform {

// Fixed names of the two files a worker keeps in the directory it serves.
inline constexpr const char* SOCKET_NAME = ".toolsock.sock";
inline constexpr const char* PID_NAME = ".toolsock.pid";
// Output of a worker started with --daemon.
inline constexpr const char* LOG_NAME = ".toolsock.log";

std::string config_dir();

std::string socket_path(const std::string& dir);
std::string pid_path(const std::string& dir);
std::string log_path(const std::string& dir);

// Liveness record that sits next to a discovered socket.
std::string pid_path_for_socket(const std::string& socket_path);

} // namespace platform
