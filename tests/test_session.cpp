#include <catch2/catch_test_macros.hpp>

#include "common/line_io.hpp"
#include "common/session.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

// Session on one end of a socketpair, test driving the other end.
struct SessionPair {
    int fds[2] = {-1, -1};

    SessionPair() { ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds); }
    ~SessionPair() {
        for (int fd : fds) {
            if (fd >= 0) ::close(fd);
        }
    }

    int peer() const { return fds[0]; }
    int session_fd() const { return fds[1]; }
};

} // namespace

TEST_CASE("Session dispatch", "[session]") {
    ProtocolEngine engine(test::echo_tools(), {.name = "toolsock-test", .version = "1.0.0"});

    SECTION("ParseErrorAsInternalError") {
        Session session(-1, -1, engine);
        auto resp = session.dispatch("{not json");
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["id"] == 0);
        REQUIRE((*resp)["error"]["code"] == -32603);
        REQUIRE((*resp)["error"]["message"].get<std::string>().starts_with("Internal error:"));
    }

    SECTION("ParseErrorAsParseError") {
        Session session(-1, -1, engine, ParseErrorReply::ParseError);
        auto resp = session.dispatch("{not json");
        REQUIRE(resp.has_value());
        REQUIRE((*resp)["id"].is_null());
        REQUIRE((*resp)["error"]["code"] == -32700);
        REQUIRE((*resp)["error"]["message"].get<std::string>().starts_with("Parse error:"));
    }

    SECTION("InvalidUtf8LineAnsweredWithSerializableError") {
        const std::string line = "{\"method\":\"\xff\"}";
        Session worker_side(-1, -1, engine);
        auto internal = worker_side.dispatch(line);
        REQUIRE(internal.has_value());
        REQUIRE((*internal)["error"]["code"] == -32603);
        REQUIRE_NOTHROW(json::parse(rpc::serialize(*internal)));

        Session relay_side(-1, -1, engine, ParseErrorReply::ParseError);
        auto parse = relay_side.dispatch(line);
        REQUIRE(parse.has_value());
        REQUIRE((*parse)["error"]["code"] == -32700);
        REQUIRE_NOTHROW(json::parse(rpc::serialize(*parse)));
    }

    SECTION("NotificationHasNoReply") {
        Session session(-1, -1, engine);
        REQUIRE_FALSE(session.dispatch(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    }
}

TEST_CASE("Session over a socket", "[session]") {
    ProtocolEngine engine(test::echo_tools(), {.name = "toolsock-test", .version = "1.0.0"});
    SessionPair pair;
    REQUIRE(pair.peer() >= 0);

    Session session(pair.session_fd(), pair.session_fd(), engine);
    std::jthread runner([&session] { session.run(); });
    // Ends the session before runner is joined, also when a REQUIRE throws.
    struct HangUp {
        int fd;
        ~HangUp() { ::shutdown(fd, SHUT_WR); }
    } hang_up{pair.peer()};
    LineReader reader(pair.peer());
    std::string reply;

    SECTION("RepliesInOrder") {
        REQUIRE(write_line(pair.peer(), R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"));
        REQUIRE(write_line(pair.peer(), R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
        REQUIRE(write_line(pair.peer(),
                           R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})"));

        REQUIRE(reader.read_line(reply, {}, 2000) == ReadStatus::Ok);
        REQUIRE(json::parse(reply)["id"] == 1);
        REQUIRE(reader.read_line(reply, {}, 2000) == ReadStatus::Ok);
        auto second = json::parse(reply);
        REQUIRE(second["id"] == 2);
        REQUIRE(second["result"]["content"][0]["text"] == "hi");
    }

    SECTION("BlankLinesSkipped") {
        REQUIRE(write_line(pair.peer(), ""));
        REQUIRE(write_line(pair.peer(), "   "));
        REQUIRE(write_line(pair.peer(), R"({"jsonrpc":"2.0","id":5,"method":"tools/list"})"));
        REQUIRE(reader.read_line(reply, {}, 2000) == ReadStatus::Ok);
        REQUIRE(json::parse(reply)["id"] == 5);
    }

    SECTION("InvalidUtf8DoesNotEndSession") {
        REQUIRE(write_line(pair.peer(), "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"\xff\xfe\"}"));
        REQUIRE(reader.read_line(reply, {}, 2000) == ReadStatus::Ok);
        auto err = json::parse(reply);
        REQUIRE(err["error"]["code"] == -32603);

        REQUIRE(write_line(pair.peer(), R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})"));
        REQUIRE(reader.read_line(reply, {}, 2000) == ReadStatus::Ok);
        REQUIRE(json::parse(reply)["id"] == 7);
    }

    SECTION("BadLineDoesNotEndSession") {
        REQUIRE(write_line(pair.peer(), "garbage"));
        REQUIRE(reader.read_line(reply, {}, 2000) == ReadStatus::Ok);
        REQUIRE(json::parse(reply)["error"]["code"] == -32603);

        REQUIRE(write_line(pair.peer(), R"({"jsonrpc":"2.0","id":6,"method":"tools/list"})"));
        REQUIRE(reader.read_line(reply, {}, 2000) == ReadStatus::Ok);
        REQUIRE(json::parse(reply)["id"] == 6);
    }

    ::shutdown(pair.peer(), SHUT_WR);
    runner.join();
    REQUIRE(session.state() == SessionState::Closed);
}

TEST_CASE("LineReader", "[session]") {
    SessionPair pair;

    SECTION("PartialLineAtEof") {
        REQUIRE(::write(pair.peer(), "one\r\ntwo", 8) == 8);
        ::shutdown(pair.peer(), SHUT_WR);

        LineReader reader(pair.session_fd());
        std::string line;
        REQUIRE(reader.read_line(line) == ReadStatus::Ok);
        REQUIRE(line == "one");
        REQUIRE(reader.read_line(line) == ReadStatus::Ok);
        REQUIRE(line == "two");
        REQUIRE(reader.read_line(line) == ReadStatus::Eof);
    }

    SECTION("Timeout") {
        LineReader reader(pair.session_fd());
        std::string line;
        REQUIRE(reader.read_line(line, {}, 100) == ReadStatus::Timeout);
    }

    SECTION("Stopped") {
        std::stop_source source;
        source.request_stop();
        LineReader reader(pair.session_fd());
        std::string line;
        REQUIRE(reader.read_line(line, source.get_token()) == ReadStatus::Stopped);
    }
}
