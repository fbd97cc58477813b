#pragma once
#include "../tool.hpp"
#include "../executor.hpp"
#include "../policy.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace cmdgate {

class EventBus;

struct ExecuteCommandArgs {
    std::string command;
    std::string working_directory;                  // empty = server cwd
    std::optional<std::chrono::milliseconds> timeout; // unset = executor default
    std::map<std::string, std::string> env;
};

// The required command field only.
std::optional<ToolResult> parse_command_arg(const nlohmann::json& args,
                                            ExecuteCommandArgs& out);

// working_directory, timeout and env.
std::optional<ToolResult> parse_execute_options(const nlohmann::json& args,
                                                std::chrono::milliseconds max_timeout,
                                                ExecuteCommandArgs& out);

// Validate raw tools/call arguments once, at the tool boundary.
// Timeouts are clamped to [1ms, max_timeout]; "0s" means default.
// Returns an error ToolResult on invalid input.
std::optional<ToolResult> parse_execute_args(const nlohmann::json& args,
                                             std::chrono::milliseconds max_timeout,
                                             ExecuteCommandArgs& out);

// Result payload: {stdout, stderr, exit_code, duration, error?}
nlohmann::json execution_result_json(const ExecutionResult& result);

class ExecuteCommandTool : public Tool {
public:
    ExecuteCommandTool(const CommandPolicy& policy,
                       const CommandExecutor& executor,
                       std::chrono::milliseconds max_timeout,
                       const EventBus* bus = nullptr);

    ToolResult execute(const nlohmann::json& args) const override;
    std::string tool_name() const override { return "execute_command"; }
    std::string description() const override;
    nlohmann::json input_schema() const override;
    nlohmann::json annotations() const override;

private:
    const CommandPolicy& policy_;
    const CommandExecutor& executor_;
    std::chrono::milliseconds max_timeout_;
    const EventBus* bus_;
};

} // namespace cmdgate
