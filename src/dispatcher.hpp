#pragma once
#include "tool.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cmdgate {

class EventBus;
class ToolRegistry;

namespace rpc_error {
    constexpr int ParseError     = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
} // namespace rpc_error

constexpr const char* kDefaultProtocolVersion = "2024-11-05";

struct ServerInfo {
    std::string name = "cmdgate";
    std::string version;
};

nlohmann::json make_error_response(const nlohmann::json& id, int code,
                                   const std::string& message);
nlohmann::json make_result_response(const nlohmann::json& id, nlohmann::json result);

// Routes JSON-RPC envelopes to protocol methods and registered tools.
// Stateless between messages, so one instance serves every transport
// and every connection concurrently.
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& registry, ServerInfo info,
               const EventBus* bus = nullptr);

    // Raw line/body in, serialized response out. std::nullopt means
    // nothing must be written (notification or stray client response).
    std::optional<std::string> handle_message(const std::string& raw) const;

    // Same, on an already parsed envelope.
    std::optional<nlohmann::json> handle(const nlohmann::json& message) const;

    // Run one tool by name. Unknown tools and handler exceptions come
    // back as error results.
    ToolResult call_tool(const std::string& name, const nlohmann::json& arguments) const;

    const ServerInfo& info() const { return info_; }

private:
    nlohmann::json initialize(const nlohmann::json& params) const;
    nlohmann::json list_tools() const;

    const ToolRegistry& registry_;
    ServerInfo info_;
    const EventBus* bus_;
};

} // namespace cmdgate
