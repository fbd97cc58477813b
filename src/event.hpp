#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace cmdgate {

// Tag-based event dispatch without RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ToolCall       = "ToolCall";
    constexpr const char* CommandExec    = "CommandExec";
    constexpr const char* CommandBlocked = "CommandBlocked";
    constexpr const char* WebFetch       = "WebFetch";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct ToolCallEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCall;
    std::string tool_name;
    std::string arguments;   // compact JSON

    ToolCallEvent() { type_tag = TAG; }
};

struct CommandExecEvent : Event {
    static constexpr const char* TAG = event_tags::CommandExec;
    std::string command;
    std::string working_directory;
    int exit_code = 0;
    std::chrono::nanoseconds duration{0};
    std::string error;

    CommandExecEvent() { type_tag = TAG; }
};

struct CommandBlockedEvent : Event {
    static constexpr const char* TAG = event_tags::CommandBlocked;
    std::string command;
    std::string reason;

    CommandBlockedEvent() { type_tag = TAG; }
};

struct WebFetchEvent : Event {
    static constexpr const char* TAG = event_tags::WebFetch;
    std::string method;
    std::string url;
    long status_code = 0;
    size_t bytes = 0;
    std::chrono::nanoseconds duration{0};
    std::string error;

    WebFetchEvent() { type_tag = TAG; }
};

} // namespace cmdgate
