#include "dispatcher.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "tool_registry.hpp"

#include <exception>

namespace cmdgate {

using nlohmann::json;

json make_error_response(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

json make_result_response(const json& id, json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)}
    };
}

static bool valid_id(const json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

static std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

Dispatcher::Dispatcher(const ToolRegistry& registry, ServerInfo info, const EventBus* bus)
    : registry_(registry), info_(std::move(info)), bus_(bus) {}

std::optional<std::string> Dispatcher::handle_message(const std::string& raw) const {
    json message;
    try {
        message = json::parse(raw);
    } catch (const json::parse_error& e) {
        return dump(make_error_response(nullptr, rpc_error::ParseError,
                                        std::string("Parse error: ") + e.what()));
    }

    auto response = handle(message);
    if (!response) return std::nullopt;
    try {
        return response->dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        json id = response->contains("id") ? (*response)["id"] : json(nullptr);
        return dump(make_error_response(id, rpc_error::InternalError,
                                        std::string("Internal error: ") + e.what()));
    }
}

std::optional<json> Dispatcher::handle(const json& message) const {
    if (message.is_array()) {
        return make_error_response(nullptr, rpc_error::InvalidRequest,
                                   "Invalid Request: batch requests are not supported");
    }
    if (!message.is_object()) {
        return make_error_response(nullptr, rpc_error::InvalidRequest,
                                   "Invalid Request: expected a JSON object");
    }

    const bool has_id = message.contains("id");
    json id = has_id ? message["id"] : json(nullptr);
    if (!valid_id(id)) {
        return make_error_response(nullptr, rpc_error::InvalidRequest,
                                   "Invalid Request: id must be a string, number or null");
    }

    // A client answering a server request; nothing to do.
    if (!has_id && !message.contains("method") &&
        (message.contains("result") || message.contains("error"))) {
        return std::nullopt;
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        return make_error_response(id, rpc_error::InvalidRequest,
                                   "Invalid Request: jsonrpc must be \"2.0\"");
    }

    if (!message.contains("method") || !message["method"].is_string()) {
        return make_error_response(id, rpc_error::InvalidRequest,
                                   "Invalid Request: method must be a string");
    }
    const std::string method = message["method"].get<std::string>();
    const json params = message.contains("params") ? message["params"] : json(nullptr);

    // Notifications never produce output and never run tools.
    if (!has_id || id.is_null()) {
        return std::nullopt;
    }

    if (method == "initialize") {
        return make_result_response(id, initialize(params));
    }
    if (method == "ping") {
        return make_result_response(id, json::object());
    }
    if (method == "tools/list") {
        return make_result_response(id, list_tools());
    }
    if (method == "tools/call") {
        if (!params.is_object()) {
            return make_error_response(id, rpc_error::InvalidParams,
                                       "Invalid params: expected an object");
        }
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error_response(id, rpc_error::InvalidParams,
                                       "Invalid params: name must be a string");
        }
        json arguments = json::object();
        if (params.contains("arguments") && !params["arguments"].is_null()) {
            if (!params["arguments"].is_object()) {
                return make_error_response(id, rpc_error::InvalidParams,
                                           "Invalid params: arguments must be an object");
            }
            arguments = params["arguments"];
        }

        ToolResult result = call_tool(params["name"].get<std::string>(), arguments);
        json content = json::array();
        content.push_back({{"type", "text"}, {"text", result.text}});
        return make_result_response(id, {{"content", content}, {"isError", result.is_error}});
    }

    return make_error_response(id, rpc_error::MethodNotFound, "Method not found: " + method);
}

ToolResult Dispatcher::call_tool(const std::string& name, const json& arguments) const {
    const Tool* tool = registry_.find(name);
    if (!tool) {
        return ToolResult{true, "Unknown tool: " + name};
    }

    if (bus_ && bus_->has_subscribers(event_tags::ToolCall)) {
        ToolCallEvent ev;
        ev.tool_name = name;
        ev.arguments = dump(arguments);
        bus_->publish(ev);
    }

    try {
        return tool->execute(arguments);
    } catch (const std::exception& e) {
        return ToolResult{true, "Tool " + name + " failed: " + e.what()};
    }
}

json Dispatcher::initialize(const json& params) const {
    std::string version = kDefaultProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string() &&
        !params["protocolVersion"].get<std::string>().empty()) {
        version = params["protocolVersion"].get<std::string>();
    }
    return {
        {"protocolVersion", version},
        {"capabilities", {{"tools", json::object()}}},
        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}}
    };
}

json Dispatcher::list_tools() const {
    json tools = json::array();
    for (const auto& spec : registry_.specs()) {
        json t = {
            {"name", spec.name},
            {"description", spec.description},
            {"inputSchema", spec.input_schema}
        };
        if (!spec.annotations.is_null()) t["annotations"] = spec.annotations;
        tools.push_back(std::move(t));
    }
    return {{"tools", tools}};
}

} // namespace cmdgate
