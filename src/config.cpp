#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cmdgate {

nlohmann::json Config::defaults_json() {
    return {
        {"commands", {
            {"allowed", nlohmann::json::array()},
            {"blocked", nlohmann::json::array()},
            {"use_default_blocklist", true},
            {"shell", "/bin/sh"},
            {"shell_arg", "-c"},
            {"default_timeout", "30s"},
            {"max_timeout", "1h"},
            {"max_output_bytes", 1048576}
        }},
        {"http", {
            {"enabled", false},
            {"host", "127.0.0.1"},
            {"port", 3000},
            {"auth_token", ""},
            {"max_body", 1048576},
            {"max_connections", 32}
        }},
        {"log", {
            {"dir", ""},
            {"level", "info"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static std::vector<std::string> string_list(const nlohmann::json& arr) {
    std::vector<std::string> out;
    if (!arr.is_array()) return out;
    for (const auto& v : arr) {
        if (v.is_string()) {
            std::string s = trim(v.get<std::string>());
            if (!s.empty()) out.push_back(std::move(s));
        }
    }
    return out;
}

std::chrono::milliseconds parse_timeout_setting(const std::string& name,
                                                const std::string& value) {
    std::chrono::nanoseconds ns;
    try {
        ns = parse_duration(value);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("invalid " + name + ": " + e.what());
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ns);
    if (ms.count() <= 0) {
        throw std::invalid_argument("invalid " + name + ": must be at least 1ms");
    }
    return ms;
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.cmdgate/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception&) {
            std::cerr << "[config] Malformed config, using defaults: "
                      << config_path << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    if (j.contains("commands") && j["commands"].is_object()) {
        auto& c = j["commands"];
        if (c.contains("allowed"))
            cfg.commands.allowed = string_list(c["allowed"]);
        if (c.contains("blocked"))
            cfg.commands.blocked = string_list(c["blocked"]);
        if (c.contains("use_default_blocklist") && c["use_default_blocklist"].is_boolean())
            cfg.commands.use_default_blocklist = c["use_default_blocklist"].get<bool>();
        if (c.contains("shell") && c["shell"].is_string() && !c["shell"].get<std::string>().empty())
            cfg.commands.shell = c["shell"].get<std::string>();
        if (c.contains("shell_arg") && c["shell_arg"].is_string())
            cfg.commands.shell_arg = c["shell_arg"].get<std::string>();
        if (c.contains("default_timeout") && c["default_timeout"].is_string())
            cfg.commands.default_timeout = parse_timeout_setting(
                "default_timeout", c["default_timeout"].get<std::string>());
        if (c.contains("max_timeout") && c["max_timeout"].is_string())
            cfg.commands.max_timeout = parse_timeout_setting(
                "max_timeout", c["max_timeout"].get<std::string>());
        if (c.contains("max_output_bytes") && c["max_output_bytes"].is_number_unsigned())
            cfg.commands.max_output_bytes = c["max_output_bytes"].get<size_t>();
    }

    if (j.contains("http") && j["http"].is_object()) {
        auto& h = j["http"];
        if (h.contains("enabled") && h["enabled"].is_boolean())
            cfg.http.enabled = h["enabled"].get<bool>();
        if (h.contains("host") && h["host"].is_string())
            cfg.http.host = h["host"].get<std::string>();
        if (h.contains("port") && h["port"].is_number_unsigned()) {
            auto port = h["port"].get<uint32_t>();
            if (port == 0 || port > 65535)
                throw std::invalid_argument("invalid http.port: " + std::to_string(port));
            cfg.http.port = static_cast<uint16_t>(port);
        }
        if (h.contains("auth_token") && h["auth_token"].is_string())
            cfg.http.auth_token = h["auth_token"].get<std::string>();
        if (h.contains("max_body") && h["max_body"].is_number_unsigned())
            cfg.http.max_body = h["max_body"].get<uint32_t>();
        if (h.contains("max_connections") && h["max_connections"].is_number_unsigned())
            cfg.http.max_connections = h["max_connections"].get<uint32_t>();
    }

    if (j.contains("log") && j["log"].is_object()) {
        auto& l = j["log"];
        if (l.contains("dir") && l["dir"].is_string())
            cfg.log.dir = l["dir"].get<std::string>();
        if (l.contains("level") && l["level"].is_string())
            cfg.log.level = l["level"].get<std::string>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("MCP_ALLOWED_COMMANDS"))
        cfg.commands.allowed = split_list(v);
    if (const char* v = std::getenv("MCP_BLOCKED_COMMANDS"))
        cfg.commands.blocked = split_list(v);
    if (const char* v = std::getenv("MCP_DEFAULT_TIMEOUT"))
        cfg.commands.default_timeout = parse_timeout_setting("MCP_DEFAULT_TIMEOUT", v);
    if (const char* v = std::getenv("MCP_SHELL"); v && *v)
        cfg.commands.shell = v;
    if (const char* v = std::getenv("MCP_SHELL_ARG"))
        cfg.commands.shell_arg = v;
    if (const char* v = std::getenv("MCP_LOG_DIR"))
        cfg.log.dir = v;
    if (const char* v = std::getenv("MCP_LOG_LEVEL"))
        cfg.log.level = v;
    if (const char* v = std::getenv("MCP_AUTH_TOKEN"))
        cfg.http.auth_token = v;

    return cfg;
}

CommandPolicy Config::policy() const {
    CommandPolicy p;
    p.allow_patterns = commands.allowed;
    p.block_patterns = commands.blocked;
    if (commands.use_default_blocklist) {
        for (auto& b : default_blocked_commands()) {
            p.block_patterns.push_back(std::move(b));
        }
    }
    return p;
}

std::vector<std::string> Config::describe() const {
    auto policy_now = policy();
    std::vector<std::string> lines;
    lines.push_back("allowed commands: " +
                    (commands.allowed.empty() ? std::string("(all)") : join(commands.allowed, ",")));
    lines.push_back("blocked commands: " + join(policy_now.block_patterns, ","));
    lines.push_back("default timeout: " + format_duration(commands.default_timeout));
    lines.push_back("max timeout: " + format_duration(commands.max_timeout));
    lines.push_back("shell: " + commands.shell + " " + commands.shell_arg);
    lines.push_back("log level: " + log.level);
    lines.push_back("log dir: " + (log.dir.empty() ? std::string("(stderr only)") : log.dir));
    if (http.enabled) {
        lines.push_back("transport: http " + http.host + ":" + std::to_string(http.port) +
                        (http.auth_token.empty() ? " (no auth)" : " (bearer auth)"));
    } else {
        lines.push_back("transport: stdio");
    }
    return lines;
}

int load_env_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return 0;

    int count = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (std::getenv(key.c_str()) != nullptr) continue;
        if (::setenv(key.c_str(), value.c_str(), 0) == 0) ++count;
    }
    return count;
}

} // namespace cmdgate
