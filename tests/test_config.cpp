#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <vector>

using namespace sandbox_tail;

namespace {

Config parse(std::vector<const char*> args) {
    args.insert(args.begin(), "sandbox-tail");
    return parse_args(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("split_endpoint", "[config]") {
    auto ep = split_endpoint("http://10.0.0.5:5051/files/read");
    REQUIRE(ep.origin == "http://10.0.0.5:5051");
    REQUIRE(ep.path == "/files/read");

    ep = split_endpoint("https://leader.mesos");
    REQUIRE(ep.origin == "https://leader.mesos");
    REQUIRE(ep.path == "/");

    REQUIRE_THROWS_AS(split_endpoint("leader.mesos/files/read"), std::invalid_argument);
    REQUIRE_THROWS_AS(split_endpoint("http:///files/read"), std::invalid_argument);
}

TEST_CASE("parse_args serve mode", "[config]") {
    SECTION("Defaults") {
        auto config = parse({"--endpoint", "http://agent:5051/files/read", "--agent-id", "S1"});
        REQUIRE(config.mode == Mode::Serve);
        REQUIRE(config.http_port == 8080);
        REQUIRE(config.poll_interval_ms == 500);
        REQUIRE(config.chunk_size == kDefaultChunkSize);
        REQUIRE(config.coords.agent_id == "S1");
        REQUIRE_FALSE(config.verbose);
    }

    SECTION("Explicit options") {
        auto config = parse({"serve", "--endpoint", "http://agent:5051/files/read", "--agent-id", "S1",
                             "--http-port", "9000", "--poll-interval-ms", "250", "--verbose"});
        REQUIRE(config.http_port == 9000);
        REQUIRE(config.poll_interval_ms == 250);
        REQUIRE(config.verbose);
    }

    SECTION("Millisecond options past int range are rejected") {
        REQUIRE_THROWS_AS(parse({"--endpoint", "http://a/files/read", "--agent-id", "S1",
                                 "--timeout-ms", "4294967297"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parse({"--endpoint", "http://a/files/read", "--agent-id", "S1",
                                 "--poll-interval-ms", "2147483648"}), std::invalid_argument);
        auto config = parse({"--endpoint", "http://a/files/read", "--agent-id", "S1",
                             "--timeout-ms", "2147483647"});
        REQUIRE(config.timeout_ms == 2147483647);
    }

    SECTION("Tail-only options are rejected") {
        REQUIRE_THROWS_AS(parse({"--endpoint", "http://a/files/read", "--agent-id", "S1", "-n", "5"}),
                          std::invalid_argument);
    }
}

TEST_CASE("parse_args tail mode", "[config]") {
    std::vector<const char*> base = {"tail", "--endpoint", "http://agent:5051/files/read",
                                     "--agent-id", "S1", "--framework-id", "F1",
                                     "--executor-id", "E1", "--container-id", "C1"};

    SECTION("Defaults read the whole stdout") {
        auto config = parse(base);
        REQUIRE(config.mode == Mode::Tail);
        REQUIRE(config.file == "stdout");
        REQUIRE(config.format == "text");
        REQUIRE(config.coords.container_id == "C1");

        auto rc = config.read_config();
        REQUIRE(rc.direction == ReadDirection::TopToBottom);
        REQUIRE_FALSE(rc.stream);
        REQUIRE(rc.max_lines > 0);
    }

    SECTION("Tail and follow") {
        auto args = base;
        for (const char* a : {"-n", "25", "-f", "--format", "sse", "--file", "stderr",
                              "--task-path", "web.1", "--header", "Authorization: token=abc"}) {
            args.push_back(a);
        }
        auto config = parse(args);
        REQUIRE(config.coords.task_path == "web.1");
        REQUIRE(config.file == "stderr");
        REQUIRE(config.format == "sse");

        auto rc = config.read_config();
        REQUIRE(rc.direction == ReadDirection::BottomToTop);
        REQUIRE(rc.max_lines == 25);
        REQUIRE(rc.stream);
        REQUIRE(rc.headers.find("Authorization")->second == "token=abc");
    }

    SECTION("Limit") {
        auto args = base;
        args.push_back("--limit");
        args.push_back("10");
        auto rc = parse(args).read_config();
        REQUIRE(rc.direction == ReadDirection::TopToBottom);
        REQUIRE(rc.max_lines == 10);
    }

    SECTION("Bad values") {
        auto args = base;
        args.push_back("-n");
        args.push_back("0");
        REQUIRE_THROWS_AS(parse(args), std::invalid_argument);

        args = base;
        args.push_back("--format");
        args.push_back("xml");
        REQUIRE_THROWS_AS(parse(args), std::invalid_argument);

        args = base;
        args.push_back("--limit");
        REQUIRE_THROWS_AS(parse(args), std::invalid_argument);

        args = base;
        for (const char* a : {"-n", "3", "--limit", "4"}) args.push_back(a);
        REQUIRE_THROWS_AS(parse(args), std::invalid_argument);

        args = base;
        args.push_back("--header");
        args.push_back("no-colon");
        REQUIRE_THROWS_AS(parse(args), std::invalid_argument);
    }
}

TEST_CASE("parse_args required options and help", "[config]") {
    REQUIRE_THROWS_AS(parse({"--agent-id", "S1"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"--endpoint", "http://agent/files/read"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"--bogus"}), std::invalid_argument);
    REQUIRE(parse({"tail", "--help"}).show_help);
}

TEST_CASE("TaskCoordinates", "[config][sandbox]") {
    TaskCoordinates coords;
    coords.agent_id = "S1";
    coords.framework_id = "F1";
    coords.executor_id = "E1";
    coords.container_id = "C1";

    REQUIRE(coords.sandbox_path() ==
            "/var/lib/mesos/slave/slaves/S1/frameworks/F1/executors/E1/runs/C1/");
    coords.task_path = "web.1";
    REQUIRE(coords.file_path("stdout") ==
            "/var/lib/mesos/slave/slaves/S1/frameworks/F1/executors/E1/runs/C1/tasks/web.1/stdout");
    REQUIRE_NOTHROW(coords.validate());

    coords.container_id.clear();
    REQUIRE_THROWS_AS(coords.validate(), std::invalid_argument);
}
