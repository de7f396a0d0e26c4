#include "server/daemonize.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <unistd.h>

namespace platform {

namespace {

void redirect(int target_fd, const char* path, int flags) {
    int fd = ::open(path, flags | O_CLOEXEC, 0644);
    if (fd < 0) return;
    ::dup2(fd, target_fd);
    ::close(fd);
}

} // namespace

bool daemonize(const std::string& log_path) {
    pid_t first = ::fork();
    if (first < 0) {
        std::println(stderr, "daemonize: fork() failed: {}", std::strerror(errno));
        return false;
    }
    if (first > 0) ::_exit(0);

    if (::setsid() < 0) ::_exit(1);

    // Session leader exits so the worker can never reacquire a terminal
    pid_t second = ::fork();
    if (second != 0) ::_exit(second < 0 ? 1 : 0);

    redirect(STDIN_FILENO, "/dev/null", O_RDONLY);
    const char* out = log_path.empty() ? "/dev/null" : log_path.c_str();
    redirect(STDOUT_FILENO, out, O_WRONLY | O_CREAT | O_APPEND);
    redirect(STDERR_FILENO, out, O_WRONLY | O_CREAT | O_APPEND);
    return true;
}

} // namespace platform
