#include "common/config.hpp"
#include "common/session.hpp"
#include "relay/discovery.hpp"
#include "relay/forwarder.hpp"
#include "relay/http_transport.hpp"
#include "relay/relay_tools.hpp"

#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstring>
#include <print>
#include <string>
#include <sys/signalfd.h>
#include <unistd.h>

static void usage(const char* prog) {
    std::println("Usage: {} [options]", prog);
    std::println("Relay tool calls to the toolsock worker serving each project directory");
    std::println("Options:");
    std::println("  -t, --transport MODE  stdio (default) or http");
    std::println("  -p, --port PORT       HTTP port (default: 3000)");
    std::println("      --timeout SECS    Per-step socket timeout (default: 30)");
    std::println("  -v, --verbose         Enable verbose logging");
    std::println("  -c, --config PATH     Config file path");
    std::println("  -h, --help            Show this help");
}

template <typename T>
static bool parse_number(const std::string& s, T& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

static int run_http(const ProtocolEngine& engine, const Config& config, bool verbose) {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    int signal_fd = signalfd(-1, &mask, SFD_CLOEXEC);
    if (signal_fd < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return 1;
    }

    HttpTransport http(engine, verbose);
    if (!http.start(config.relay.http_bind, config.relay.http_port)) {
        ::close(signal_fd);
        return 1;
    }
    std::println(stderr, "toolsock-relay listening on http://{}:{}", config.relay.http_bind, http.port());

    signalfd_siginfo info;
    while (::read(signal_fd, &info, sizeof(info)) < 0 && errno == EINTR) {
    }
    if (verbose) {
        std::println(stderr, "[toolsock-relay] Received signal, shutting down");
    }

    ::close(signal_fd);
    http.stop();
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string transport;
    std::string port_arg;
    std::string timeout_arg;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--transport" || arg == "-t") {
            if (i + 1 < argc) transport = argv[++i];
        } else if (arg == "--port" || arg == "-p") {
            if (i + 1 < argc) port_arg = argv[++i];
        } else if (arg == "--timeout") {
            if (i + 1 < argc) timeout_arg = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    auto config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    if (!transport.empty()) config.relay.transport = transport;
    if (!port_arg.empty() && !parse_number(port_arg, config.relay.http_port)) {
        std::println(stderr, "Invalid port: {}", port_arg);
        return 1;
    }
    if (!timeout_arg.empty() && (!parse_number(timeout_arg, config.relay.socket_timeout) ||
                                 config.relay.socket_timeout == 0)) {
        std::println(stderr, "Invalid timeout: {}", timeout_arg);
        return 1;
    }
    if (config.relay.transport != "stdio" && config.relay.transport != "http") {
        std::println(stderr, "Unknown transport: {} (expected stdio or http)", config.relay.transport);
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);

    DiscoveryCache discovery(std::chrono::seconds(config.relay.cache_ttl));
    Forwarder forwarder(discovery, std::chrono::seconds(config.relay.socket_timeout), verbose);
    ProtocolEngine engine(tools::make_relay_tools(forwarder),
                          {.name = "toolsock-relay", .version = "1.0.0"});

    if (config.relay.transport == "http") {
        return run_http(engine, config, verbose);
    }

    if (verbose) {
        std::println(stderr, "[toolsock-relay] serving {} tools on stdio", engine.tools().size());
    }
    Session session(STDIN_FILENO, STDOUT_FILENO, engine, ParseErrorReply::ParseError);
    session.run();
    return 0;
}
