#include "tool_registry.hpp"
#include <stdexcept>

namespace cmdgate {

void ToolRegistry::add(std::unique_ptr<Tool> tool) {
    if (!tool) {
        throw std::invalid_argument("Cannot register a null tool");
    }
    std::string name = tool->tool_name();
    if (name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (index_.count(name) > 0) {
        throw std::invalid_argument("Duplicate tool: " + name);
    }
    index_[name] = tools_.size();
    tools_.push_back(std::move(tool));
}

const Tool* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return tools_[it->second].get();
}

std::vector<ToolSpec> ToolRegistry::specs() const {
    std::vector<ToolSpec> result;
    result.reserve(tools_.size());
    for (const auto& tool : tools_) {
        result.push_back(tool->spec());
    }
    return result;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(tools_.size());
    for (const auto& tool : tools_) {
        result.push_back(tool->tool_name());
    }
    return result;
}

} // namespace cmdgate
