#include "execute_command.hpp"
#include "tool_util.hpp"
#include "../event.hpp"
#include "../event_bus.hpp"
#include "../util.hpp"

#include <filesystem>
#include <stdexcept>

namespace cmdgate {

std::optional<ToolResult> parse_command_arg(const nlohmann::json& args,
                                            ExecuteCommandArgs& out) {
    if (!args.is_object()) {
        return error_result("arguments must be an object");
    }
    if (auto err = require_string(args, "command")) return err;
    out.command = args["command"].get<std::string>();
    if (trim(out.command).empty()) {
        return error_result("command is required");
    }
    return std::nullopt;
}

std::optional<ToolResult> parse_execute_options(const nlohmann::json& args,
                                                std::chrono::milliseconds max_timeout,
                                                ExecuteCommandArgs& out) {
    if (auto err = optional_string(args, "working_directory", out.working_directory)) return err;
    if (!out.working_directory.empty() &&
        !std::filesystem::path(out.working_directory).is_absolute()) {
        return error_result("working_directory must be an absolute path: " +
                            out.working_directory);
    }

    std::string timeout_text;
    if (auto err = optional_string(args, "timeout", timeout_text)) {
        return error_result("Invalid timeout format: expected a duration string such as \"30s\"");
    }
    if (!timeout_text.empty()) {
        std::chrono::nanoseconds ns;
        try {
            ns = parse_duration(timeout_text);
        } catch (const std::invalid_argument& e) {
            return error_result(std::string("Invalid timeout format: ") + e.what());
        }
        if (ns.count() > 0) {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ns);
            if (ms.count() < 1) ms = std::chrono::milliseconds(1);
            if (ms > max_timeout) ms = max_timeout;
            out.timeout = ms;
        }
    }

    if (auto err = optional_string_map(args, "env", out.env)) return err;
    for (const auto& [key, value] : out.env) {
        if (key.empty() || key.find('=') != std::string::npos) {
            return error_result("env contains an invalid variable name: '" + key + "'");
        }
    }
    return std::nullopt;
}

std::optional<ToolResult> parse_execute_args(const nlohmann::json& args,
                                             std::chrono::milliseconds max_timeout,
                                             ExecuteCommandArgs& out) {
    if (auto err = parse_command_arg(args, out)) return err;
    return parse_execute_options(args, max_timeout, out);
}

nlohmann::json execution_result_json(const ExecutionResult& result) {
    nlohmann::json j = {
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"exit_code", result.exit_code},
        {"duration", format_duration(result.duration)}
    };
    if (!result.error.empty()) {
        j["error"] = result.error;
    }
    return j;
}

ExecuteCommandTool::ExecuteCommandTool(const CommandPolicy& policy,
                                       const CommandExecutor& executor,
                                       std::chrono::milliseconds max_timeout,
                                       const EventBus* bus)
    : policy_(policy), executor_(executor), max_timeout_(max_timeout), bus_(bus) {}

ToolResult ExecuteCommandTool::execute(const nlohmann::json& args) const {
    ExecuteCommandArgs parsed;
    if (auto err = parse_command_arg(args, parsed)) {
        return *err;
    }

    // Policy runs before the optional fields so a blocked attempt is
    // always recorded, whatever else is wrong with the call.
    if (auto reason = check_command(parsed.command, policy_)) {
        CommandBlockedEvent ev;
        ev.command = parsed.command;
        ev.reason = *reason;
        emit(bus_, ev);
        return error_result("Command validation failed: " + *reason);
    }

    if (auto err = parse_execute_options(args, max_timeout_, parsed)) {
        return *err;
    }

    ExecRequest request;
    request.command = parsed.command;
    request.working_directory = parsed.working_directory;
    request.timeout = parsed.timeout;
    request.env = parsed.env;
    ExecutionResult result = executor_.execute(request);

    CommandExecEvent ev;
    ev.command = parsed.command;
    ev.working_directory = parsed.working_directory;
    ev.exit_code = result.exit_code;
    ev.duration = result.duration;
    ev.error = result.error;
    emit(bus_, ev);

    return ToolResult{result.exit_code != 0, json_text(execution_result_json(result))};
}

std::string ExecuteCommandTool::description() const {
    return "Execute a system command and return its output. Commands are validated "
           "against allow/block lists before execution - use list_allowed_commands and "
           "list_blocked_commands to check what's permitted. Supports timeout, working "
           "directory, and environment variables.";
}

nlohmann::json ExecuteCommandTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"command", {
                {"type", "string"},
                {"description", "The command to execute. Passed to the configured shell as a "
                                "single argument, so pipes and redirects work."}
            }},
            {"working_directory", {
                {"type", "string"},
                {"description", "Absolute path of an existing directory to run the command in. "
                                "Defaults to the server's working directory."}
            }},
            {"timeout", {
                {"type", "string"},
                {"description", "Timeout as a duration: '500ms', '30s', '5m', '1m30s'. "
                                "Default 30s; clamped to the server maximum."}
            }},
            {"env", {
                {"type", "object"},
                {"description", "Extra environment variables, e.g. {\"NODE_ENV\": \"production\"}. "
                                "Added to the inherited environment, not replacing it."},
                {"additionalProperties", {{"type", "string"}}}
            }}
        }},
        {"required", nlohmann::json::array({"command"})}
    };
}

nlohmann::json ExecuteCommandTool::annotations() const {
    return {
        {"title", "Execute Command"},
        {"readOnlyHint", false},
        {"destructiveHint", true},
        {"idempotentHint", false},
        {"openWorldHint", true}
    };
}

} // namespace cmdgate
