#pragma once

#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/budget_errors.hpp"

namespace budget::protocol {

inline constexpr const char* kJsonRpcVersion = "2.0";

// JSON-RPC 2.0 error codes used by this server.
namespace rpc_codes {
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kServerError = -32000;
}  // namespace rpc_codes

struct Request {
    std::string jsonrpc;
    std::optional<nlohmann::json> id;  // Absent = notification; may hold null
    std::string method;
    std::optional<nlohmann::json> params;

    bool is_notification() const { return !id.has_value(); }
};

struct RpcError {
    int code = rpc_codes::kInternalError;
    std::string message;
    std::optional<nlohmann::json> data;
};

// Holds exactly one of a result or an error.
struct Response {
    nlohmann::json id;
    std::variant<nlohmann::json, RpcError> payload;

    bool is_error() const { return std::holds_alternative<RpcError>(payload); }
    const nlohmann::json& result() const { return std::get<nlohmann::json>(payload); }
    const RpcError& error() const { return std::get<RpcError>(payload); }
};

core::errors::Result<Request> parse_request(const std::string& text);

Response build_success(nlohmann::json id, nlohmann::json result);
Response build_error(nlohmann::json id, int code, std::string message,
                     std::optional<nlohmann::json> data = std::nullopt);

// Maps a domain error onto its JSON-RPC code.
int rpc_code_for(core::errors::ErrorCategory category);
Response build_error(nlohmann::json id, const core::errors::BudgetError& error);

nlohmann::json to_json(const Response& response);
std::string serialize(const Response& response);

}  // namespace budget::protocol
