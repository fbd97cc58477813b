#pragma once
#include <fstream>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace cmdgate {

class EventBus;

// Ordered by verbosity: a logger at level L writes every message <= L.
enum class LogLevel {
    Off = 0,
    Error,
    Warn,
    Info,
    Access,   // one line per executed command
    Debug,
};

// Case-insensitive; "warning" is accepted, anything unknown maps to Info.
LogLevel parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

// Line-oriented logger. Writes to a stream (stderr by default, never stdout:
// stdout carries the stdio protocol) and optionally to a dated log file.
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Info);
    Logger(LogLevel level, std::ostream& sink);

    // Also append to <dir>/cmdgate/cmdgate-YYYY-MM-DD.log.
    // Throws std::runtime_error if the file cannot be opened.
    void open_file(const std::string& dir);
    std::string file_path() const;

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);
    void error(const std::string& message)  { log(LogLevel::Error, message); }
    void warn(const std::string& message)   { log(LogLevel::Warn, message); }
    void info(const std::string& message)   { log(LogLevel::Info, message); }
    void access(const std::string& message) { log(LogLevel::Access, message); }
    void debug(const std::string& message)  { log(LogLevel::Debug, message); }

    // Subscribe to the tool, command and web_fetch events.
    // The logger must outlive the bus subscriptions.
    void attach(EventBus& bus);

    void log_startup(const std::string& version, const std::vector<std::string>& settings);
    void log_shutdown(const std::string& reason);

private:
    mutable std::mutex mutex_;
    LogLevel level_;
    std::ostream* sink_;
    std::ofstream file_;
    std::string file_path_;
};

} // namespace cmdgate
