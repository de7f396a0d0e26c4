#include "common/session.hpp"

#include "common/line_io.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <print>

using json = nlohmann::json;

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

// Best-effort id of a request that failed after parsing.
json recover_id(const json& request) {
    if (request.is_object() && request.contains("id")) {
        const auto& id = request["id"];
        if (id.is_string() || id.is_number()) return id;
    }
    return 0;
}

} // namespace

Session::Session(int in_fd, int out_fd, const ProtocolEngine& engine, ParseErrorReply parse_errors)
    : in_fd_(in_fd), out_fd_(out_fd), engine_(engine), parse_errors_(parse_errors) {}

void Session::run() {
    LineReader reader(in_fd_);
    std::string line;

    while (true) {
        state_ = SessionState::Reading;
        auto status = reader.read_line(line);
        if (status == ReadStatus::Eof) break;
        if (status != ReadStatus::Ok) {
            std::println(stderr, "session: read failed: {}", std::strerror(reader.last_error()));
            break;
        }
        if (is_blank(line)) continue;

        state_ = SessionState::Dispatching;
        auto response = dispatch(line);
        ++requests_;

        if (!response) continue;

        state_ = SessionState::Writing;
        if (!write_line(out_fd_, rpc::serialize(*response))) {
            std::println(stderr, "session: write failed: {}", std::strerror(errno));
            break;
        }
    }

    state_ = SessionState::Closed;
}

std::optional<json> Session::dispatch(const std::string& line) const {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        std::println(stderr, "session: bad request line: {}", e.what());
        if (parse_errors_ == ParseErrorReply::ParseError) {
            return rpc::make_error(nullptr, rpc::PARSE_ERROR, std::string("Parse error: ") + e.what());
        }
        return rpc::make_error(0, rpc::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }

    try {
        return engine_.handle(request);
    } catch (const std::exception& e) {
        std::println(stderr, "session: request failed: {}", e.what());
        return rpc::make_error(recover_id(request), rpc::INTERNAL_ERROR,
                               std::string("Internal error: ") + e.what());
    }
}
