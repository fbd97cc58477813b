#pragma once
#include <optional>
#include <string>
#include <vector>

namespace cmdgate {

// Allow/block rules for shell commands. Both lists are matched
// case-insensitively; block patterns are always checked first.
struct CommandPolicy {
    std::vector<std::string> allow_patterns; // prefix match; empty = allow all
    std::vector<std::string> block_patterns; // prefix or substring match
};

// Dangerous commands blocked unless the blocklist is disabled.
std::vector<std::string> default_blocked_commands();

// Returns the rejection reason, or std::nullopt when the command may run.
// Pure: no state, same answer for the same inputs.
std::optional<std::string> check_command(const std::string& command,
                                         const CommandPolicy& policy);

} // namespace cmdgate
