#include "log.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace cmdgate {

LogLevel parse_log_level(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "off")                      return LogLevel::Off;
    if (n == "error")                    return LogLevel::Error;
    if (n == "warn" || n == "warning")   return LogLevel::Warn;
    if (n == "info")                     return LogLevel::Info;
    if (n == "access")                   return LogLevel::Access;
    if (n == "debug")                    return LogLevel::Debug;
    return LogLevel::Info;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Off:    return "OFF";
        case LogLevel::Error:  return "ERROR";
        case LogLevel::Warn:   return "WARN";
        case LogLevel::Info:   return "INFO";
        case LogLevel::Access: return "ACCESS";
        case LogLevel::Debug:  return "DEBUG";
    }
    return "UNKNOWN";
}

Logger::Logger(LogLevel level)
    : level_(level), sink_(&std::cerr) {}

Logger::Logger(LogLevel level, std::ostream& sink)
    : level_(level), sink_(&sink) {}

void Logger::open_file(const std::string& dir) {
    auto folder = std::filesystem::path(expand_home(dir)) / "cmdgate";
    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec) {
        throw std::runtime_error("cannot create log directory " + folder.string() +
                                 ": " + ec.message());
    }

    auto path = folder / ("cmdgate-" + date_today() + ".log");
    std::lock_guard<std::mutex> lock(mutex_);
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        throw std::runtime_error("cannot open log file " + path.string());
    }
    file_path_ = path.string();
}

std::string Logger::file_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_path_;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::Off && level <= level_;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::Off || level > level_) return;

    std::string line = timestamp_now() + " [" + log_level_name(level) + "] " + message + "\n";
    *sink_ << line << std::flush;
    if (file_.is_open()) {
        file_ << line << std::flush;
    }
}

void Logger::attach(EventBus& bus) {
    subscribe<ToolCallEvent>(bus, [this](const ToolCallEvent& ev) {
        info("tool call: " + ev.tool_name + " " + ev.arguments);
    });

    subscribe<CommandExecEvent>(bus, [this](const CommandExecEvent& ev) {
        std::string msg = "exec: \"" + ev.command + "\"";
        if (!ev.working_directory.empty()) msg += " cwd=" + ev.working_directory;
        msg += " exit=" + std::to_string(ev.exit_code);
        msg += " duration=" + format_duration(ev.duration);
        if (!ev.error.empty()) msg += " error=\"" + ev.error + "\"";
        access(msg);
    });

    subscribe<CommandBlockedEvent>(bus, [this](const CommandBlockedEvent& ev) {
        warn("blocked: \"" + ev.command + "\" (" + ev.reason + ")");
    });

    subscribe<WebFetchEvent>(bus, [this](const WebFetchEvent& ev) {
        std::string msg = "web_fetch: " + ev.method + " " + ev.url + " -> ";
        if (!ev.error.empty()) {
            warn(msg + "failed: " + ev.error);
            return;
        }
        info(msg + std::to_string(ev.status_code) + " (" + std::to_string(ev.bytes) +
             " bytes, " + format_duration(ev.duration) + ")");
    });
}

void Logger::log_startup(const std::string& version, const std::vector<std::string>& settings) {
    info("cmdgate " + version + " starting");
    for (const auto& s : settings) {
        info("  " + s);
    }
}

void Logger::log_shutdown(const std::string& reason) {
    info("cmdgate shutting down: " + reason);
}

} // namespace cmdgate
