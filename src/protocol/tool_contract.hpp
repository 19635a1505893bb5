#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace budget::protocol {

    // How a tool is advertised by tools/list
    struct ToolDescriptor {
        std::string name;         // e.g., "search_transactions"
        std::string description;
    };

    // A tools/call request after dispatcher validation
    struct ToolCall {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

} // namespace budget::protocol
