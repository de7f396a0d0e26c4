#include <catch2/catch_test_macros.hpp>

#include "common/config.hpp"
#include "common/protocol.hpp"
#include "common/tool_catalog.hpp"
#include "server/builtin_tools.hpp"
#include "test_support.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;
using namespace std::chrono_literals;

TEST_CASE("exec_shell", "[tools]") {
    test::TmpDir dir("exec");

    SECTION("CapturesStdoutAndStderr") {
        auto r = tools::exec_shell("echo out; echo err >&2", dir.path, 5s);
        REQUIRE(r.has_value());
        REQUIRE(r->find("out\n") != std::string::npos);
        REQUIRE(r->find("err\n") != std::string::npos);
        REQUIRE(r->find("[exit status") == std::string::npos);
    }

    SECTION("RunsInServedDirectory") {
        auto r = tools::exec_shell("pwd", dir.path, 5s);
        REQUIRE(r.has_value());
        REQUIRE(*r == dir.path + "\n");
    }

    SECTION("NonZeroExitAppended") {
        auto r = tools::exec_shell("printf partial; exit 3", dir.path, 5s);
        REQUIRE(r.has_value());
        REQUIRE(*r == "partial\n[exit status 3]");
    }

    SECTION("NoStdin") {
        auto r = tools::exec_shell("cat", dir.path, 5s);
        REQUIRE(r.has_value());
        REQUIRE(r->empty());
    }

    SECTION("TimeoutKillsCommand") {
        auto started = std::chrono::steady_clock::now();
        auto r = tools::exec_shell("sleep 30", dir.path, 1s);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().message == "command timed out after 1s");
        REQUIRE(std::chrono::steady_clock::now() - started < 10s);
    }

    SECTION("BinaryOutputSerializable") {
        auto r = tools::exec_shell("printf 'a\\377\\376b'", dir.path, 5s);
        REQUIRE(r.has_value());
        REQUIRE(r->size() == 4);
        REQUIRE((*r)[1] == '\xff');

        auto wire = rpc::serialize(rpc::make_result(1, rpc::text_content(*r)));
        auto text = json::parse(wire)["result"]["content"][0]["text"].get<std::string>();
        REQUIRE(text.front() == 'a');
        REQUIRE(text.back() == 'b');
    }

    SECTION("EmptyCommandRejected") {
        auto r = tools::exec_shell("", dir.path, 5s);
        REQUIRE_FALSE(r.has_value());
    }
}

TEST_CASE("Builtin tool registry", "[tools]") {
    test::TmpDir dir("builtin");
    Config cfg;
    auto registry = tools::make_builtin_tools(cfg, dir.path);

    SECTION("MatchesCatalog") {
        auto entries = tools::catalog();
        REQUIRE(registry.size() == entries.size());
        for (const auto& entry : entries) {
            auto* tool = registry.find(entry.name);
            REQUIRE(tool != nullptr);
            REQUIRE(tool->invoke);
            REQUIRE(tool->input_schema == entry.input_schema);
        }
    }

    SECTION("ExecShellRequiresCommand") {
        auto r = registry.find(tools::EXEC_SHELL)->invoke(json::object());
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().message == "command parameter is required");
    }

    SECTION("ExecShellRuns") {
        auto r = registry.find(tools::EXEC_SHELL)->invoke({{"command", "echo hi"}});
        REQUIRE(r.has_value());
        REQUIRE(*r == "hi\n");
    }

    SECTION("DefaultUsageText") {
        auto r = registry.find(tools::USAGE_INSTRUCTIONS)->invoke(json::object());
        REQUIRE(r.has_value());
        REQUIRE(r->find("exec_shell") != std::string::npos);
    }

    SECTION("EnvironmentReport") {
        auto r = registry.find(tools::INVESTIGATE_ENVIRONMENT)->invoke(json::object());
        REQUIRE(r.has_value());
        REQUIRE(r->find("Served directory:  " + dir.path) != std::string::npos);
        REQUIRE(r->find("Process id:        " + std::to_string(getpid())) != std::string::npos);
        REQUIRE(r->find("  - exec_shell") != std::string::npos);
    }
}

TEST_CASE("usage_instructions", "[tools]") {
    test::TmpDir dir("usage");

    SECTION("FromFile") {
        auto path = dir.path + "/usage.md";
        test::write_file(path, "custom usage\n");
        auto r = tools::usage_instructions(path);
        REQUIRE(r.has_value());
        REQUIRE(*r == "custom usage\n");
    }

    SECTION("MissingFile") {
        auto r = tools::usage_instructions(dir.path + "/absent.md");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().message.find("absent.md") != std::string::npos);
    }
}
