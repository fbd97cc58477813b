#pragma once
#include "policy.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cmdgate {

struct CommandConfig {
    std::vector<std::string> allowed;
    std::vector<std::string> blocked;
    bool use_default_blocklist = true;
    std::string shell = "/bin/sh";
    std::string shell_arg = "-c";
    std::chrono::milliseconds default_timeout{30000};
    std::chrono::milliseconds max_timeout{3600000};
    size_t max_output_bytes = 1048576;
};

struct HttpConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    uint16_t port = 3000;
    std::string auth_token;          // empty = no authentication
    uint32_t max_body = 1048576;
    uint32_t max_connections = 32;
};

struct LogConfig {
    std::string dir;                 // empty = stderr only
    std::string level = "info";
};

struct Config {
    CommandConfig commands;
    HttpConfig http;
    LogConfig log;

    // Load from ~/.cmdgate/config.json + MCP_* env vars.
    // Throws std::invalid_argument on an invalid value.
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Effective policy: configured lists plus the default blocklist when enabled
    CommandPolicy policy() const;

    // One-line-per-setting summary for the startup log
    std::vector<std::string> describe() const;
};

// Parse a config timeout, rejecting zero and malformed values.
std::chrono::milliseconds parse_timeout_setting(const std::string& name,
                                                const std::string& value);

// Load KEY=VALUE lines into the process environment without overriding
// variables that are already set. Missing file is not an error.
// Returns the number of variables set.
int load_env_file(const std::string& path);

} // namespace cmdgate
