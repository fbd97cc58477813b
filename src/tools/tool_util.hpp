#pragma once
#include "../tool.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace cmdgate {

inline ToolResult text_result(std::string text) {
    return ToolResult{false, std::move(text)};
}

inline ToolResult error_result(std::string text) {
    return ToolResult{true, std::move(text)};
}

// Pretty JSON for tool content. Invalid UTF-8 in captured output is
// replaced rather than failing the dump.
inline std::string json_text(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Check that a required, non-empty string field exists.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string() ||
        args[field].get<std::string>().empty()) {
        return error_result(std::string(field) + " is required");
    }
    return std::nullopt;
}

// Read an optional string field into out. Absent or null leaves out untouched.
inline std::optional<ToolResult> optional_string(const nlohmann::json& args, const char* field,
                                                 std::string& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_string()) {
        return error_result(std::string(field) + " must be a string");
    }
    out = args[field].get<std::string>();
    return std::nullopt;
}

// Read an optional {string: string} object into out.
inline std::optional<ToolResult> optional_string_map(const nlohmann::json& args, const char* field,
                                                     std::map<std::string, std::string>& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_object()) {
        return error_result(std::string(field) + " must be an object of string values");
    }
    for (const auto& [key, value] : args[field].items()) {
        if (!value.is_string()) {
            return error_result(std::string(field) + "." + key + " must be a string");
        }
        out[key] = value.get<std::string>();
    }
    return std::nullopt;
}

} // namespace cmdgate
