#pragma once

#include <chrono>
#include <format>
#include <string>

enum class RelayErrorKind { Discovery, Liveness, Transport, Timeout };

struct RelayError {
    RelayErrorKind kind;
    std::string message;
};

// "30s" for whole seconds, "250ms" otherwise.
inline std::string format_duration(std::chrono::milliseconds d) {
    if (d.count() % 1000 == 0) return std::format("{}s", d.count() / 1000);
    return std::format("{}ms", d.count());
}
