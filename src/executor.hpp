#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace cmdgate {

struct ExecutorConfig {
    std::string shell = "/bin/sh";
    std::string shell_arg = "-c";
    std::chrono::milliseconds default_timeout{30000};
    size_t max_output_bytes = 1048576; // per stream
};

struct ExecRequest {
    std::string command;
    std::string working_directory;                  // empty = inherit
    std::optional<std::chrono::milliseconds> timeout; // unset = config default
    std::map<std::string, std::string> env;         // merged over inherited env
};

// Outcome of one execution. exit_code is -1 for failures that never
// produced an exit status (bad working directory, spawn failure, timeout).
struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::chrono::nanoseconds duration{0};
    std::string error;       // empty when the process ran to completion
    bool timed_out = false;
};

// Runs `<shell> <shell_arg> <command>` in its own process group with a
// deadline. Never throws; every failure is reported in the result.
// Safe to call from several threads at once.
class CommandExecutor {
public:
    explicit CommandExecutor(ExecutorConfig config);

    ExecutionResult execute(const ExecRequest& request) const;

    const ExecutorConfig& config() const { return config_; }

    // Number of child processes forked so far.
    uint64_t processes_spawned() const { return spawned_.load(); }

private:
    ExecutorConfig config_;
    mutable std::atomic<uint64_t> spawned_{0};
};

} // namespace cmdgate
