#include <catch2/catch.hpp>
#include "executor.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace cmdgate;
using namespace std::chrono_literals;

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "cmdgate_exec_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static ExecRequest request(const std::string& command) {
    ExecRequest req;
    req.command = command;
    return req;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST_CASE("CommandExecutor: echo hello", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    auto result = exec.execute(request("echo hello"));

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_text == "hello\n");
    REQUIRE(result.stderr_text.empty());
    REQUIRE(result.error.empty());
    REQUIRE_FALSE(result.timed_out);
    REQUIRE(result.duration.count() > 0);
    REQUIRE(exec.processes_spawned() == 1);
}

TEST_CASE("CommandExecutor: captures stdout and stderr separately", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    auto result = exec.execute(request("echo out; echo err 1>&2"));

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_text == "out\n");
    REQUIRE(result.stderr_text == "err\n");
}

TEST_CASE("CommandExecutor: reports non-zero exit status", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    auto result = exec.execute(request("exit 3"));

    REQUIRE(result.exit_code == 3);
    REQUIRE(result.error.empty());
}

TEST_CASE("CommandExecutor: death by signal maps to 128+N", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    auto result = exec.execute(request("kill -9 $$"));

    REQUIRE(result.exit_code == 137);
}

TEST_CASE("CommandExecutor: shell features work", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    auto result = exec.execute(request("printf 'a\\nb\\nc\\n' | wc -l | tr -d ' '"));

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_text == "3\n");
}

TEST_CASE("CommandExecutor: stdin is empty", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    auto result = exec.execute(request("cat; echo done"));

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_text == "done\n");
}

TEST_CASE("CommandExecutor: timeout kills the command", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    auto req = request("sleep 10");
    req.timeout = 200ms;

    auto result = exec.execute(req);

    REQUIRE(result.exit_code == -1);
    REQUIRE(result.timed_out);
    REQUIRE(result.error == "command timed out after 200ms");
    REQUIRE(result.duration >= 200ms);
    REQUIRE(result.duration < 3s);
}

TEST_CASE("CommandExecutor: default timeout comes from config", "[executor]") {
    ExecutorConfig cfg;
    cfg.default_timeout = 150ms;
    CommandExecutor exec(cfg);

    auto result = exec.execute(request("sleep 10"));
    REQUIRE(result.timed_out);
    REQUIRE(result.error == "command timed out after 150ms");
}

#ifdef __linux__
// True once pid is gone or a zombie.
static bool process_dead(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) return true;
    std::string content((std::istreambuf_iterator<char>(stat)), std::istreambuf_iterator<char>());
    auto close = content.rfind(')');
    return close != std::string::npos && close + 2 < content.size() &&
           content[close + 2] == 'Z';
}

TEST_CASE("CommandExecutor: timeout kills background children too", "[executor]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    std::string pid_file = dir + "/child.pid";

    CommandExecutor exec(ExecutorConfig{});
    auto req = request("sleep 30 & echo $! > " + pid_file + "; wait");
    req.timeout = 300ms;
    auto result = exec.execute(req);
    REQUIRE(result.timed_out);

    std::ifstream in(pid_file);
    pid_t child = 0;
    in >> child;
    REQUIRE(child > 0);

    bool dead = false;
    for (int i = 0; i < 100 && !dead; ++i) {
        dead = process_dead(child);
        if (!dead) std::this_thread::sleep_for(20ms);
    }
    REQUIRE(dead);

    std::filesystem::remove_all(dir);
}
#endif

TEST_CASE("CommandExecutor: background child holding pipes does not block", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    auto start = std::chrono::steady_clock::now();
    auto result = exec.execute(request("sleep 2 & echo started"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_text == "started\n");
    REQUIRE(elapsed < 1500ms);
}

TEST_CASE("CommandExecutor: runs in the requested directory", "[executor]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());

    CommandExecutor exec(ExecutorConfig{});
    auto req = request("pwd -P");
    req.working_directory = dir;
    auto result = exec.execute(req);

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_text == std::filesystem::canonical(dir).string() + "\n");

    std::filesystem::remove_all(dir);
}

TEST_CASE("CommandExecutor: missing working directory spawns nothing", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    auto req = request("echo never");
    req.working_directory = "/nonexistent/cmdgate/dir";
    auto result = exec.execute(req);

    REQUIRE(result.exit_code == -1);
    REQUIRE(result.error == "working directory does not exist: /nonexistent/cmdgate/dir");
    REQUIRE(result.stdout_text.empty());
    REQUIRE(exec.processes_spawned() == 0);
}

TEST_CASE("CommandExecutor: file as working directory is rejected", "[executor]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    std::string file = dir + "/plain.txt";
    { std::ofstream f(file); f << "x"; }

    CommandExecutor exec(ExecutorConfig{});
    auto req = request("echo never");
    req.working_directory = file;
    auto result = exec.execute(req);

    REQUIRE(result.exit_code == -1);
    REQUIRE(contains(result.error, "is not a directory"));
    REQUIRE(exec.processes_spawned() == 0);

    std::filesystem::remove_all(dir);
}

TEST_CASE("CommandExecutor: env entries supplement the environment", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    auto req = request("echo \"$CMDGATE_GREETING\"; command -v sh > /dev/null && echo path-ok");
    req.env["CMDGATE_GREETING"] = "hi there";
    auto result = exec.execute(req);

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_text == "hi there\npath-ok\n");
}

TEST_CASE("CommandExecutor: env entries override inherited values", "[executor]") {
    setenv("CMDGATE_OVERRIDE_ME", "parent", 1);
    CommandExecutor exec(ExecutorConfig{});
    auto req = request("echo $CMDGATE_OVERRIDE_ME");
    req.env["CMDGATE_OVERRIDE_ME"] = "child";
    auto result = exec.execute(req);
    unsetenv("CMDGATE_OVERRIDE_ME");

    REQUIRE(result.stdout_text == "child\n");
}

TEST_CASE("CommandExecutor: missing shell is a spawn failure", "[executor]") {
    ExecutorConfig cfg;
    cfg.shell = "/nonexistent/bin/sh";
    CommandExecutor exec(cfg);
    auto result = exec.execute(request("echo hello"));

    REQUIRE(result.exit_code == -1);
    REQUIRE(contains(result.error, "failed to start /nonexistent/bin/sh"));
}

TEST_CASE("CommandExecutor: output is capped per stream", "[executor]") {
    ExecutorConfig cfg;
    cfg.max_output_bytes = 10;
    CommandExecutor exec(cfg);
    auto result = exec.execute(request("printf '%050d' 0"));

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_text == "0000000000\n[truncated]");
}

TEST_CASE("CommandExecutor: concurrent executions are independent", "[executor]") {
    CommandExecutor exec(ExecutorConfig{});
    std::vector<ExecutionResult> results(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i]() {
            results[i] = exec.execute(request("echo " + std::to_string(i)));
        });
    }
    for (auto& t : threads) t.join();

    for (size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i].exit_code == 0);
        REQUIRE(results[i].stdout_text == std::to_string(i) + "\n");
    }
    REQUIRE(exec.processes_spawned() == 4);
}
