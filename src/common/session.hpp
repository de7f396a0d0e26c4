#pragma once

#include "common/protocol.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// How a line that is not valid JSON is answered.
enum class ParseErrorReply {
    Internal,   // -32603 "Internal error: ...", id 0 (worker sockets)
    ParseError, // -32700 "Parse error: ...", id null (relay stdio)
};

enum class SessionState { Reading, Dispatching, Writing, Closed };

// Drives one connection: read a line, dispatch it, write the reply, repeat.
// Does not own the descriptors.
class Session {
public:
    Session(int in_fd, int out_fd, const ProtocolEngine& engine,
            ParseErrorReply parse_errors = ParseErrorReply::Internal);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Returns once the peer closes its end or I/O fails.
    void run();

    SessionState state() const { return state_; }
    size_t requests_handled() const { return requests_; }

    // Reply for one raw line; std::nullopt when nothing should be written.
    std::optional<nlohmann::json> dispatch(const std::string& line) const;

private:
    int in_fd_;
    int out_fd_;
    const ProtocolEngine& engine_;
    ParseErrorReply parse_errors_;
    SessionState state_ = SessionState::Reading;
    size_t requests_ = 0;
};
