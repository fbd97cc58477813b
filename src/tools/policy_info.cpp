#include "policy_info.hpp"
#include "tool_util.hpp"
#include "../util.hpp"

namespace cmdgate {

static nlohmann::json no_arguments_schema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

static nlohmann::json read_only_annotations(const char* title) {
    return {{"title", title}, {"readOnlyHint", true}, {"idempotentHint", true}};
}

static nlohmann::json non_empty(const std::vector<std::string>& patterns) {
    auto out = nlohmann::json::array();
    for (const auto& p : patterns) {
        if (!trim(p).empty()) out.push_back(p);
    }
    return out;
}

// ── list_allowed_commands ───────────────────────────────────────

ToolResult ListAllowedCommandsTool::execute(const nlohmann::json& /*args*/) const {
    auto allowed = non_empty(policy_.allow_patterns);
    nlohmann::json j = {
        {"allowed_commands", allowed},
        {"allow_all", allowed.empty()}
    };
    return text_result(json_text(j));
}

std::string ListAllowedCommandsTool::description() const {
    return "List the allowed command patterns. If the list is empty, every command is "
           "allowed except those matching a blocked pattern. Otherwise a command must "
           "start with one of the patterns (case-insensitive) to run.";
}

nlohmann::json ListAllowedCommandsTool::input_schema() const {
    return no_arguments_schema();
}

nlohmann::json ListAllowedCommandsTool::annotations() const {
    return read_only_annotations("List Allowed Commands");
}

// ── list_blocked_commands ───────────────────────────────────────

ToolResult ListBlockedCommandsTool::execute(const nlohmann::json& /*args*/) const {
    nlohmann::json j = {
        {"blocked_commands", non_empty(policy_.block_patterns)},
        {"using_default_blocklist", using_default_blocklist_}
    };
    return text_result(json_text(j));
}

std::string ListBlockedCommandsTool::description() const {
    return "List the blocked command patterns. A command that starts with or contains "
           "a blocked pattern is rejected, even when it also matches an allowed pattern.";
}

nlohmann::json ListBlockedCommandsTool::input_schema() const {
    return no_arguments_schema();
}

nlohmann::json ListBlockedCommandsTool::annotations() const {
    return read_only_annotations("List Blocked Commands");
}

// ── get_shell_info ──────────────────────────────────────────────

ToolResult ShellInfoTool::execute(const nlohmann::json& /*args*/) const {
    const auto& cfg = executor_.config();
    nlohmann::json j = {
        {"shell", cfg.shell},
        {"shell_arg", cfg.shell_arg},
        {"default_timeout", format_duration(cfg.default_timeout)}
    };
    return text_result(json_text(j));
}

std::string ShellInfoTool::description() const {
    return "Get the shell used to run commands, the argument that precedes the command "
           "string, and the default timeout.";
}

nlohmann::json ShellInfoTool::input_schema() const {
    return no_arguments_schema();
}

nlohmann::json ShellInfoTool::annotations() const {
    return read_only_annotations("Get Shell Info");
}

} // namespace cmdgate
