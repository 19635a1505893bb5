#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/budget_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace budget::tools {

using ToolHandler = std::function<core::errors::Result<nlohmann::json>(const nlohmann::json&)>;

// Ordered catalog of named tools. Names are unique; lookup is by exact name.
class ToolRegistry {
public:
    // Returns the new catalog size.
    core::errors::Result<std::size_t> register_tool(std::string name, std::string description,
                                                    ToolHandler handler);

    std::vector<protocol::ToolDescriptor> list() const;

    core::errors::Result<nlohmann::json> execute(const std::string& name,
                                                 const nlohmann::json& arguments) const;

    bool contains(const std::string& name) const;
    std::size_t size() const { return entries_.size(); }

private:
    struct Entry {
        protocol::ToolDescriptor descriptor;
        ToolHandler handler;
    };

    const Entry* find(const std::string& name) const;

    std::vector<Entry> entries_;
};

}  // namespace budget::tools
