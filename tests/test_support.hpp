#pragma once

#include "common/line_io.hpp"
#include "common/tool.hpp"

#include <cstdio>
#include <cstring>
#include <expected>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>

namespace test {

// RAII temp directory under /tmp, removed recursively.
struct TmpDir {
    std::string path;

    explicit TmpDir(const std::string& tag) {
        path = "/tmp/toolsock_test_" + tag + "_" + std::to_string(getpid());
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

// Blocking client connection; -1 on failure.
inline int connect_unix(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

// One request line out, one reply line back (2s limit).
inline ReadStatus round_trip(int fd, LineReader& reader, const std::string& request, std::string& reply) {
    write_line(fd, request);
    return reader.read_line(reply, {}, 2000);
}

// Pid of a process that has already exited and been reaped.
inline int dead_pid() {
    pid_t pid = ::fork();
    if (pid == 0) ::_exit(0);
    int status = 0;
    ::waitpid(pid, &status, 0);
    return pid;
}

inline void write_file(const std::string& path, const std::string& content) {
    FILE* f = std::fopen(path.c_str(), "w");
    if (!f) return;
    std::fputs(content.c_str(), f);
    std::fclose(f);
}

// echo(text) -> text; fail() -> tool error; boom() -> throws.
inline ToolRegistry echo_tools() {
    ToolRegistry registry;
    registry.add({
        .name = "echo",
        .description = "Echo the text argument",
        .input_schema = tools::text_parameter("text", "Text to echo"),
        .invoke = [](const nlohmann::json& args) -> ToolResult {
            return args.value("text", std::string());
        },
    });
    registry.add({
        .name = "fail",
        .description = "Always fails",
        .input_schema = tools::no_parameters(),
        .invoke = [](const nlohmann::json&) -> ToolResult {
            return std::unexpected(ToolError{"it broke"});
        },
    });
    registry.add({
        .name = "boom",
        .description = "Always throws",
        .input_schema = tools::no_parameters(),
        .invoke = [](const nlohmann::json&) -> ToolResult {
            throw std::runtime_error("kaboom");
        },
    });
    return registry;
}

} // namespace test
