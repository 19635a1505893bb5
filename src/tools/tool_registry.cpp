#include "tools/tool_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace budget::tools {

using core::errors::BudgetError;
using core::errors::ErrorCategory;

core::errors::Result<std::size_t> ToolRegistry::register_tool(std::string name,
                                                              std::string description,
                                                              ToolHandler handler) {
    if (name.empty()) {
        return BudgetError{ErrorCategory::Internal, "Tool name must not be empty",
                           "invalid_tool_name"};
    }
    if (!handler) {
        return BudgetError{ErrorCategory::Internal, "Tool has no handler: " + name,
                           "missing_tool_handler"};
    }
    if (find(name) != nullptr) {
        return BudgetError{ErrorCategory::Internal, "Tool already registered: " + name,
                           "duplicate_tool"};
    }

    entries_.push_back(Entry{protocol::ToolDescriptor{std::move(name), std::move(description)},
                             std::move(handler)});
    LOG_DEBUG("ToolRegistry: registered " + entries_.back().descriptor.name);
    return entries_.size();
}

std::vector<protocol::ToolDescriptor> ToolRegistry::list() const {
    std::vector<protocol::ToolDescriptor> descriptors;
    descriptors.reserve(entries_.size());
    for (const auto& entry : entries_) {
        descriptors.push_back(entry.descriptor);
    }
    return descriptors;
}

core::errors::Result<nlohmann::json> ToolRegistry::execute(
    const std::string& name, const nlohmann::json& arguments) const {
    const Entry* entry = find(name);
    if (entry == nullptr) {
        return BudgetError{ErrorCategory::UnknownTool, "Unknown tool: " + name, "unknown_tool",
                           "Call tools/list for the available tools."};
    }

    LOG_DEBUG("ToolRegistry: executing " + name);
    return entry->handler(arguments);
}

bool ToolRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

const ToolRegistry::Entry* ToolRegistry::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.descriptor.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

}  // namespace budget::tools
