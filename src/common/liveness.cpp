#include "common/liveness.hpp"

#include "common/platform_paths.hpp"

#include <cerrno>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <signal.h>

namespace fs = std::filesystem;

namespace {

bool parse_pid(const std::string& text, int& pid) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return false;
    auto last = text.find_last_not_of(" \t\r\n");

    const char* begin = text.data() + first;
    const char* end = text.data() + last + 1;
    auto [ptr, ec] = std::from_chars(begin, end, pid);
    return ec == std::errc() && ptr == end && pid > 0;
}

} // namespace

LivenessRecord check_liveness(const std::string& pid_path) {
    std::error_code ec;
    if (!fs::exists(pid_path, ec)) return {Liveness::NoRecord, 0};

    std::ifstream f(pid_path);
    if (!f.is_open()) return {Liveness::BadRecord, 0};
    std::string text{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};

    int pid = 0;
    if (!parse_pid(text, pid)) return {Liveness::BadRecord, 0};

    // EPERM: the process exists but belongs to someone else.
    if (::kill(pid, 0) == 0 || errno == EPERM) return {Liveness::Alive, pid};
    return {Liveness::Dead, pid};
}

bool is_alive(const std::string& socket_path) {
    return check_liveness(platform::pid_path_for_socket(socket_path)).state == Liveness::Alive;
}

const char* to_string(Liveness state) {
    switch (state) {
        case Liveness::Alive: return "alive";
        case Liveness::NoRecord: return "no record";
        case Liveness::BadRecord: return "bad record";
        case Liveness::Dead: return "dead";
    }
    return "unknown";
}
