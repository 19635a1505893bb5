#include "server/protocol_dispatcher.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace budget::server {

using core::errors::BudgetError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Request;
using protocol::Response;

ProtocolDispatcher::ProtocolDispatcher(std::shared_ptr<const tools::ToolRegistry> registry)
    : registry_(std::move(registry)) {}

core::errors::Result<Response> ProtocolDispatcher::dispatch(const Request& request) const {
    if (!registry_) {
        return BudgetError{ErrorCategory::Internal, "Dispatcher has no tool registry",
                           "missing_registry"};
    }

    const json id = request.id.value_or(json(nullptr));
    if (request.method == "initialize") {
        return handle_initialize(id);
    }
    if (request.method == "tools/list") {
        return handle_tools_list(id);
    }
    if (request.method == "tools/call") {
        return handle_tools_call(id, request);
    }

    LOG_DEBUG("ProtocolDispatcher: method not found: " + request.method);
    return protocol::build_error(id, protocol::rpc_codes::kMethodNotFound, "Method not found",
                                 json{{"method", request.method}});
}

Response ProtocolDispatcher::handle_initialize(const json& id) const {
    return protocol::build_success(
        id, json{{"protocolVersion", kProtocolVersion},
                 {"capabilities", {{"tools", json::object()}}},
                 {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}});
}

Response ProtocolDispatcher::handle_tools_list(const json& id) const {
    json tools = json::array();
    for (const auto& descriptor : registry_->list()) {
        tools.push_back({{"name", descriptor.name}, {"description", descriptor.description}});
    }
    return protocol::build_success(id, json{{"tools", tools}});
}

Response ProtocolDispatcher::handle_tools_call(const json& id, const Request& request) const {
    if (!request.params.has_value() || !request.params->is_object()) {
        return protocol::build_error(
            id, BudgetError{ErrorCategory::InvalidParams, "tools/call params must be an object",
                            "invalid_params"});
    }
    const json& params = request.params.value();

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return protocol::build_error(
            id, BudgetError{ErrorCategory::InvalidParams, "Missing tool name", "invalid_params",
                            "Set params.name to one of the names from tools/list."});
    }

    protocol::ToolCall call;
    call.name = name_it->get<std::string>();
    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        call.arguments = *args_it;
    }

    auto result = registry_->execute(call.name, call.arguments);
    if (core::errors::is_error(result)) {
        BudgetError error = core::errors::get_error(result);
        LOG_WARN("ProtocolDispatcher: tool " + call.name + " failed [" +
                 core::errors::to_string(error.category) + "]: " + error.message);
        if (error.category == ErrorCategory::UnknownTool ||
            error.category == ErrorCategory::ToolExecution ||
            error.category == ErrorCategory::Provider) {
            error.message = "Tool execution failed: " + error.message;
        }
        return protocol::build_error(id, error);
    }

    json content = json::array();
    content.push_back({{"type", "text"}, {"text", core::errors::get_value(result).dump()}});
    return protocol::build_success(id, json{{"content", content}});
}

}  // namespace budget::server
