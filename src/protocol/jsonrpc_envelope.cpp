#include "protocol/jsonrpc_envelope.hpp"

#include <utility>

namespace budget::protocol {

using core::errors::BudgetError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

bool is_valid_id(const json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

BudgetError invalid_request(const std::string& message) {
    return BudgetError{ErrorCategory::InvalidRequest, message, "invalid_request"};
}

}  // namespace

core::errors::Result<Request> parse_request(const std::string& text) {
    json value = json::parse(text, nullptr, false);
    if (value.is_discarded()) {
        return BudgetError{ErrorCategory::Parse, "Invalid JSON in request body",
                           "invalid_json"};
    }
    if (!value.is_object()) {
        return invalid_request("Request must be a JSON object");
    }

    auto jsonrpc_it = value.find("jsonrpc");
    if (jsonrpc_it == value.end() || !jsonrpc_it->is_string()) {
        return invalid_request("Missing jsonrpc field");
    }
    if (jsonrpc_it->get<std::string>() != kJsonRpcVersion) {
        return invalid_request("Unsupported jsonrpc version: " +
                               jsonrpc_it->get<std::string>());
    }

    auto method_it = value.find("method");
    if (method_it == value.end() || !method_it->is_string()) {
        return invalid_request("Missing method field");
    }
    if (method_it->get<std::string>().empty()) {
        return invalid_request("Method must not be empty");
    }

    Request request;
    request.jsonrpc = jsonrpc_it->get<std::string>();
    request.method = method_it->get<std::string>();

    auto id_it = value.find("id");
    if (id_it != value.end()) {
        if (!is_valid_id(*id_it)) {
            return invalid_request("id must be a string, number or null");
        }
        request.id = *id_it;
    }

    auto params_it = value.find("params");
    if (params_it != value.end() && !params_it->is_null()) {
        request.params = std::move(*params_it);
    }
    return request;
}

Response build_success(json id, json result) {
    return Response{std::move(id), std::move(result)};
}

Response build_error(json id, const int code, std::string message,
                     std::optional<json> data) {
    return Response{std::move(id), RpcError{code, std::move(message), std::move(data)}};
}

int rpc_code_for(const ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Parse:
            return rpc_codes::kParseError;
        case ErrorCategory::InvalidRequest:
            return rpc_codes::kInvalidRequest;
        case ErrorCategory::MethodNotFound:
            return rpc_codes::kMethodNotFound;
        case ErrorCategory::InvalidParams:
            return rpc_codes::kInvalidParams;
        case ErrorCategory::UnknownTool:
        case ErrorCategory::ToolExecution:
        case ErrorCategory::Provider:
            return rpc_codes::kServerError;
        default:
            return rpc_codes::kInternalError;
    }
}

Response build_error(json id, const BudgetError& error) {
    json data = {{"code", error.code}};
    if (!error.hint.empty()) {
        data["hint"] = error.hint;
    }
    return build_error(std::move(id), rpc_code_for(error.category), error.message,
                       std::move(data));
}

json to_json(const Response& response) {
    json out;
    out["jsonrpc"] = kJsonRpcVersion;
    out["id"] = response.id;
    if (response.is_error()) {
        const auto& error = response.error();
        json error_obj;
        error_obj["code"] = error.code;
        error_obj["message"] = error.message;
        if (error.data.has_value()) {
            error_obj["data"] = error.data.value();
        }
        out["error"] = std::move(error_obj);
    } else {
        out["result"] = response.result();
    }
    return out;
}

std::string serialize(const Response& response) {
    return to_json(response).dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace budget::protocol
