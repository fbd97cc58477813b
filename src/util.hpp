#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <cstdint>

namespace cmdgate {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// Local calendar date, YYYY-MM-DD
std::string date_today();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split a comma-separated list, trimming entries and dropping empty ones
std::vector<std::string> split_list(const std::string& s);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write file via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Parse a Go-style duration ("300ms", "1.5s", "1h30m"). Units: ns us ms s m h.
// Throws std::invalid_argument on malformed input.
std::chrono::nanoseconds parse_duration(const std::string& text);

// Render a duration the way parse_duration reads it back ("1m30s", "250ms", "1.5s").
std::string format_duration(std::chrono::nanoseconds d);

} // namespace cmdgate
