#pragma once
#include "../tool.hpp"
#include "../executor.hpp"
#include "../policy.hpp"

namespace cmdgate {

// Read-only tools that let a client inspect the command policy and
// shell before calling execute_command.

class ListAllowedCommandsTool : public Tool {
public:
    explicit ListAllowedCommandsTool(const CommandPolicy& policy) : policy_(policy) {}

    ToolResult execute(const nlohmann::json& args) const override;
    std::string tool_name() const override { return "list_allowed_commands"; }
    std::string description() const override;
    nlohmann::json input_schema() const override;
    nlohmann::json annotations() const override;

private:
    const CommandPolicy& policy_;
};

class ListBlockedCommandsTool : public Tool {
public:
    ListBlockedCommandsTool(const CommandPolicy& policy, bool using_default_blocklist)
        : policy_(policy), using_default_blocklist_(using_default_blocklist) {}

    ToolResult execute(const nlohmann::json& args) const override;
    std::string tool_name() const override { return "list_blocked_commands"; }
    std::string description() const override;
    nlohmann::json input_schema() const override;
    nlohmann::json annotations() const override;

private:
    const CommandPolicy& policy_;
    bool using_default_blocklist_;
};

class ShellInfoTool : public Tool {
public:
    explicit ShellInfoTool(const CommandExecutor& executor) : executor_(executor) {}

    ToolResult execute(const nlohmann::json& args) const override;
    std::string tool_name() const override { return "get_shell_info"; }
    std::string description() const override;
    nlohmann::json input_schema() const override;
    nlohmann::json annotations() const override;

private:
    const CommandExecutor& executor_;
};

} // namespace cmdgate
