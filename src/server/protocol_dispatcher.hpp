#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/budget_errors.hpp"
#include "protocol/jsonrpc_envelope.hpp"
#include "tools/tool_registry.hpp"

namespace budget::server {

inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "budget_mcp";
inline constexpr const char* kServerVersion = "0.1.0";

// Routes a parsed request to its method handler. Protocol-level failures
// (unknown method, bad params, tool failure) come back as error Responses;
// only broken internal state is returned as a BudgetError.
class ProtocolDispatcher {
public:
    explicit ProtocolDispatcher(std::shared_ptr<const tools::ToolRegistry> registry);

    core::errors::Result<protocol::Response> dispatch(const protocol::Request& request) const;

private:
    protocol::Response handle_initialize(const nlohmann::json& id) const;
    protocol::Response handle_tools_list(const nlohmann::json& id) const;
    protocol::Response handle_tools_call(const nlohmann::json& id,
                                         const protocol::Request& request) const;

    std::shared_ptr<const tools::ToolRegistry> registry_;
};

}  // namespace budget::server
