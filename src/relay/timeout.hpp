#pragma once

#include "relay/relay_error.hpp"

#include <chrono>
#include <exception>
#include <expected>
#include <future>
#include <memory>
#include <stop_token>
#include <thread>
#include <utility>

// Runs `op(stop_token)` on its own thread and waits at most `timeout` for it.
//
// On timeout the thread is asked to stop and then detached: the caller gets a
// RelayErrorKind::Timeout error right away and never waits for the abandoned
// operation. `op` must therefore own (or share ownership of) everything it
// touches. On completion in time, op's value or error is returned as is and an
// exception thrown by op is rethrown here.
template <typename T, typename Op>
std::expected<T, RelayError> run_with_timeout(Op op, std::chrono::milliseconds timeout) {
    using Result = std::expected<T, RelayError>;

    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();

    std::jthread worker([op = std::move(op), promise](std::stop_token stop) mutable {
        try {
            promise->set_value(op(stop));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    if (future.wait_for(timeout) != std::future_status::ready) {
        worker.request_stop();
        worker.detach();
        return std::unexpected(RelayError{RelayErrorKind::Timeout, "timed out after " + format_duration(timeout)});
    }

    worker.join();
    return future.get();
}
