#pragma once
#include "tool.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdgate {

// Name -> tool table, filled once at startup. Lookups after that are
// read-only and need no locking.
class ToolRegistry {
public:
    // Throws std::invalid_argument on an empty or duplicate name.
    void add(std::unique_ptr<Tool> tool);

    // nullptr when no tool has that name.
    const Tool* find(const std::string& name) const;

    // Descriptors in registration order.
    std::vector<ToolSpec> specs() const;

    std::vector<std::string> names() const;
    size_t size() const { return tools_.size(); }

private:
    std::vector<std::unique_ptr<Tool>> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace cmdgate
