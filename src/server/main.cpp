#include "common/config.hpp"
#include "common/platform_paths.hpp"
#include "server/builtin_tools.hpp"
#include "server/daemonize.hpp"
#include "server/worker.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <print>
#include <string>
#include <sys/signalfd.h>
#include <unistd.h>

namespace fs = std::filesystem;

static void usage(const char* prog) {
    std::println("Usage: {} [options] [DIR]", prog);
    std::println("Serve tools for DIR (default: current directory) on DIR/{}", platform::SOCKET_NAME);
    std::println("Options:");
    std::println("  -d, --daemon        Detach and run in the background (output to DIR/{})", platform::LOG_NAME);
    std::println("      --force         Replace a worker that is already running in DIR");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    bool daemon = false;
    bool force = false;
    bool verbose = false;
    std::string config_path;
    std::string dir;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--daemon" || arg == "-d") {
            daemon = true;
        } else if (arg == "--force") {
            force = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        } else {
            dir = arg;
        }
    }

    auto config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    std::error_code ec;
    auto served = fs::absolute(dir.empty() ? fs::current_path(ec) : fs::path(dir), ec).lexically_normal();
    if (ec || !fs::is_directory(served, ec)) {
        std::println(stderr, "Not a directory: {}", dir.empty() ? "." : dir);
        return 1;
    }
    std::string served_dir = served.string();
    if (served_dir.size() > 1 && served_dir.back() == '/') served_dir.pop_back();

    if (daemon && !platform::daemonize(platform::log_path(served_dir))) {
        return 1;
    }

    // Block before any thread starts so every thread inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    int signal_fd = signalfd(-1, &mask, SFD_CLOEXEC);
    if (signal_fd < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return 1;
    }

    Worker worker(served_dir, tools::make_builtin_tools(config, served_dir),
                  config.server.max_clients, verbose);
    if (auto started = worker.start(force); !started) {
        std::println(stderr, "Failed to start: {}", started.error());
        ::close(signal_fd);
        return 1;
    }

    std::println(stderr, "toolsock-server running on {} with {} tools",
                 platform::socket_path(served_dir), worker.server().engine().tools().size());

    signalfd_siginfo info;
    while (::read(signal_fd, &info, sizeof(info)) < 0 && errno == EINTR) {
    }
    if (verbose) {
        std::println(stderr, "[toolsock-server] Received signal, shutting down");
    }

    ::close(signal_fd);
    worker.stop();
    return 0;
}
