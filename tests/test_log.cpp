#include <catch2/catch.hpp>
#include "log.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

using namespace cmdgate;
using namespace std::chrono_literals;

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "cmdgate_log_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST_CASE("parse_log_level: names and fallbacks", "[log]") {
    REQUIRE(parse_log_level("off") == LogLevel::Off);
    REQUIRE(parse_log_level("ERROR") == LogLevel::Error);
    REQUIRE(parse_log_level("warning") == LogLevel::Warn);
    REQUIRE(parse_log_level(" access ") == LogLevel::Access);
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("verbose") == LogLevel::Info);
    REQUIRE(std::string(log_level_name(LogLevel::Access)) == "ACCESS");
}

TEST_CASE("Logger: line format", "[log]") {
    std::ostringstream out;
    Logger logger(LogLevel::Info, out);
    logger.info("hello");

    std::string line = out.str();
    REQUIRE(line.back() == '\n');
    REQUIRE(contains(line, "Z [INFO] hello"));
}

TEST_CASE("Logger: filters by level", "[log]") {
    std::ostringstream out;
    Logger logger(LogLevel::Warn, out);
    logger.error("e");
    logger.warn("w");
    logger.info("i");
    logger.access("a");
    logger.debug("d");

    std::string text = out.str();
    REQUIRE(contains(text, "[ERROR] e"));
    REQUIRE(contains(text, "[WARN] w"));
    REQUIRE_FALSE(contains(text, "[INFO]"));
    REQUIRE_FALSE(contains(text, "[ACCESS]"));
    REQUIRE_FALSE(contains(text, "[DEBUG]"));
    REQUIRE(logger.enabled(LogLevel::Error));
    REQUIRE_FALSE(logger.enabled(LogLevel::Info));
}

TEST_CASE("Logger: off writes nothing", "[log]") {
    std::ostringstream out;
    Logger logger(LogLevel::Off, out);
    logger.error("boom");
    REQUIRE(out.str().empty());
}

TEST_CASE("Logger: set_level takes effect", "[log]") {
    std::ostringstream out;
    Logger logger(LogLevel::Error, out);
    logger.debug("hidden");
    logger.set_level(LogLevel::Debug);
    logger.debug("shown");
    REQUIRE(logger.level() == LogLevel::Debug);
    REQUIRE_FALSE(contains(out.str(), "hidden"));
    REQUIRE(contains(out.str(), "shown"));
}

TEST_CASE("Logger: open_file writes a dated log", "[log]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());

    std::ostringstream out;
    Logger logger(LogLevel::Info, out);
    logger.open_file(dir);
    REQUIRE(logger.file_path() == dir + "/cmdgate/cmdgate-" + date_today() + ".log");

    logger.info("to both");
    std::ifstream in(logger.file_path());
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(contains(ss.str(), "[INFO] to both"));
    REQUIRE(contains(out.str(), "[INFO] to both"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("Logger: open_file fails on an unusable directory", "[log]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    std::string blocker = dir + "/file";
    { std::ofstream f(blocker); f << "x"; }

    std::ostringstream out;
    Logger logger(LogLevel::Info, out);
    REQUIRE_THROWS_AS(logger.open_file(blocker), std::runtime_error);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Logger: attach logs command events", "[log]") {
    std::ostringstream out;
    Logger logger(LogLevel::Access, out);
    EventBus bus;
    logger.attach(bus);

    ToolCallEvent call;
    call.tool_name = "execute_command";
    call.arguments = R"({"command":"ls"})";
    bus.publish(call);

    CommandExecEvent exec;
    exec.command = "ls";
    exec.working_directory = "/tmp";
    exec.exit_code = 0;
    exec.duration = 1500ms;
    bus.publish(exec);

    CommandBlockedEvent blocked;
    blocked.command = "reboot";
    blocked.reason = "blocked: matches pattern 'reboot'";
    bus.publish(blocked);

    std::string text = out.str();
    REQUIRE(contains(text, "[INFO] tool call: execute_command {\"command\":\"ls\"}"));
    REQUIRE(contains(text, "[ACCESS] exec: \"ls\" cwd=/tmp exit=0 duration=1.5s"));
    REQUIRE(contains(text, "[WARN] blocked: \"reboot\" (blocked: matches pattern 'reboot')"));
}

TEST_CASE("Logger: access lines hidden at info", "[log]") {
    std::ostringstream out;
    Logger logger(LogLevel::Info, out);
    EventBus bus;
    logger.attach(bus);

    CommandExecEvent exec;
    exec.command = "ls";
    bus.publish(exec);
    REQUIRE_FALSE(contains(out.str(), "exec:"));
}

TEST_CASE("Logger: web_fetch events", "[log]") {
    std::ostringstream out;
    Logger logger(LogLevel::Info, out);
    EventBus bus;
    logger.attach(bus);

    WebFetchEvent ok;
    ok.method = "GET";
    ok.url = "https://example.com";
    ok.status_code = 200;
    ok.bytes = 42;
    ok.duration = 120ms;
    bus.publish(ok);

    WebFetchEvent failed;
    failed.method = "GET";
    failed.url = "https://bad.invalid";
    failed.error = "cannot resolve bad.invalid";
    bus.publish(failed);

    std::string text = out.str();
    REQUIRE(contains(text, "[INFO] web_fetch: GET https://example.com -> 200 (42 bytes, 120ms)"));
    REQUIRE(contains(text, "[WARN] web_fetch: GET https://bad.invalid -> failed: cannot resolve"));
}

TEST_CASE("Logger: startup banner", "[log]") {
    std::ostringstream out;
    Logger logger(LogLevel::Info, out);
    logger.log_startup("1.2.3", {"shell: /bin/sh -c"});
    logger.log_shutdown("SIGTERM");

    std::string text = out.str();
    REQUIRE(contains(text, "cmdgate 1.2.3 starting"));
    REQUIRE(contains(text, "  shell: /bin/sh -c"));
    REQUIRE(contains(text, "cmdgate shutting down: SIGTERM"));
}
