#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace cmdgate {

struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON schema for arguments
    nlohmann::json annotations;   // MCP tool hints; null when absent
};

// Tool-level outcome. is_error results still travel in a successful
// protocol envelope.
struct ToolResult {
    bool is_error;
    std::string text;
};

// A named operation callable through tools/call. execute() may run on
// several transport threads at once, so implementations keep no mutable state.
class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const nlohmann::json& args) const = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual nlohmann::json input_schema() const = 0;
    virtual nlohmann::json annotations() const { return nullptr; }

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), input_schema(), annotations()};
    }
};

} // namespace cmdgate
