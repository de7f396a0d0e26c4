#include "server/builtin_tools.hpp"

#include "common/tool_catalog.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr size_t MAX_OUTPUT_BYTES = 1 << 20;

constexpr const char* DEFAULT_USAGE = R"(# toolsock worker

This worker is shared: other agents and people may be using it at the same time.

- `exec_shell` runs one /bin/sh command in the project directory and returns its
  combined stdout/stderr. Each call is a fresh shell; `cd` and exported variables
  do not carry over to the next call.
- Commands are killed when they exceed the worker's time limit. Run long builds
  with bounded parallelism and avoid interactive programs (they get no stdin).
- `investigate_environment` reports where the worker runs and what it offers.
- Do not stop or restart the worker from inside a command; the user owns it.
)";

bool wait_child(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return false;
    }
    return true;
}

} // namespace

namespace tools {

ToolResult exec_shell(const std::string& command, const std::string& dir, std::chrono::seconds timeout) {
    if (command.empty()) {
        return std::unexpected(ToolError{"command parameter is required"});
    }

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(ToolError{std::string("pipe() failed: ") + std::strerror(errno)});
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(ToolError{std::string("fork() failed: ") + std::strerror(errno)});
    }

    if (pid == 0) {
        // Child: own process group so a timeout can kill the whole pipeline
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::dup2(pipefd[1], STDERR_FILENO);
        if (!dir.empty() && ::chdir(dir.c_str()) < 0) ::_exit(126);
        ::execl("/bin/sh", "sh", "-c", command.c_str(), nullptr);
        ::_exit(127);
    }

    // Parent: collect output until EOF or the deadline
    ::setpgid(pid, pid);
    ::close(pipefd[1]);
    std::string output;
    bool timed_out = false;
    bool truncated = false;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            timed_out = true;
            break;
        }

        pollfd pfd{.fd = pipefd[0], .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        char buf[4096];
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        if (output.size() < MAX_OUTPUT_BYTES) {
            output.append(buf, static_cast<size_t>(n));
        } else {
            truncated = true;
        }
    }
    ::close(pipefd[0]);

    if (timed_out) {
        ::kill(-pid, SIGKILL);
    }

    int status = 0;
    bool reaped = wait_child(pid, status);

    if (timed_out) {
        return std::unexpected(ToolError{std::format("command timed out after {}s", timeout.count())});
    }
    if (!reaped) {
        return std::unexpected(ToolError{std::string("waitpid() failed: ") + std::strerror(errno)});
    }

    if (truncated) output += "\n[output truncated]";
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        if (!output.empty() && output.back() != '\n') output += '\n';
        output += std::format("[exit status {}]", WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
        if (!output.empty() && output.back() != '\n') output += '\n';
        output += std::format("[killed by signal {}]", WTERMSIG(status));
    }
    return output;
}

ToolResult usage_instructions(const std::string& usage_file) {
    if (usage_file.empty()) return std::string(DEFAULT_USAGE);

    std::ifstream f(usage_file);
    if (!f.is_open()) {
        return std::unexpected(ToolError{"usage instructions not found at " + usage_file});
    }
    return std::string{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

std::string environment_report(const std::string& dir, std::chrono::steady_clock::time_point started,
                               const std::vector<std::string>& tool_names) {
    std::error_code ec;
    auto cwd = fs::current_path(ec);

    char host[256] = {};
    if (::gethostname(host, sizeof(host) - 1) < 0) host[0] = '\0';

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);

    std::string report;
    report += std::format("Working directory: {}\n", ec ? "(unknown)" : cwd.string());
    report += std::format("Served directory:  {}\n", dir);
    report += std::format("Process id:        {}\n", ::getpid());
    report += std::format("User id:           {}\n", ::getuid());
    report += std::format("Host name:         {}\n", host[0] ? host : "(unknown)");
    report += std::format("Uptime:            {}s\n", uptime.count());
    report += std::format("Tools ({}):\n", tool_names.size());
    for (const auto& name : tool_names) {
        report += std::format("  - {}\n", name);
    }
    return report;
}

ToolRegistry make_builtin_tools(const Config& config, const std::string& dir) {
    auto started = std::chrono::steady_clock::now();
    auto entries = catalog();

    std::vector<std::string> names;
    for (const auto& entry : entries) names.push_back(entry.name);

    ToolRegistry registry;
    for (auto& entry : entries) {
        if (entry.name == EXEC_SHELL) {
            auto timeout = std::chrono::seconds(config.server.exec_timeout);
            entry.invoke = [dir, timeout](const json& args) -> ToolResult {
                if (!args.is_object() || !args.contains("command") || !args["command"].is_string()) {
                    return std::unexpected(ToolError{"command parameter is required"});
                }
                return exec_shell(args["command"].get<std::string>(), dir, timeout);
            };
        } else if (entry.name == USAGE_INSTRUCTIONS) {
            entry.invoke = [file = config.server.usage_file](const json&) {
                return usage_instructions(file);
            };
        } else if (entry.name == INVESTIGATE_ENVIRONMENT) {
            entry.invoke = [dir, started, names](const json&) -> ToolResult {
                return environment_report(dir, started, names);
            };
        }
        registry.add(std::move(entry));
    }
    return registry;
}

} // namespace tools
