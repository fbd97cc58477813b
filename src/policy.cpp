#include "policy.hpp"
#include "util.hpp"

namespace cmdgate {

std::vector<std::string> default_blocked_commands() {
    return {
        "rm -rf /",
        "rm -rf /*",
        "mkfs",
        "dd if=",
        ":(){:|:&};:",
        "chmod -R 777 /",
        "chown -R",
        "> /dev/sda",
        "shutdown",
        "reboot",
        "halt",
        "poweroff",
        "init 0",
        "init 6",
    };
}

std::optional<std::string> check_command(const std::string& command,
                                         const CommandPolicy& policy) {
    std::string folded = to_lower(trim(command));

    for (const auto& pattern : policy.block_patterns) {
        std::string p = to_lower(trim(pattern));
        if (p.empty()) continue;
        // Substring also catches patterns chained after ;, && or |
        if (folded.rfind(p, 0) == 0 || folded.find(p) != std::string::npos) {
            return "blocked: matches pattern '" + pattern + "'";
        }
    }

    bool any_allow = false;
    for (const auto& pattern : policy.allow_patterns) {
        std::string p = to_lower(trim(pattern));
        if (p.empty()) continue;
        any_allow = true;
        if (folded.rfind(p, 0) == 0) return std::nullopt;
    }

    if (!any_allow) return std::nullopt;
    return std::string("not allowed: no matching prefix");
}

} // namespace cmdgate
