#pragma once
#include <string>
#include <utility>
#include <variant>

namespace budget::core::errors {

    // 1. Typed error categories. Each maps to exactly one handling policy.
    enum class ErrorCategory {
        Framing,         // Bad or missing Content-Length header
        Truncated,       // Stream ended before the declared body length
        Encoding,        // Body bytes are not valid UTF-8
        Io,              // Stream failure while reading or writing
        Parse,           // Body is not syntactically valid JSON
        InvalidRequest,  // Valid JSON, but not a JSON-RPC 2.0 request
        MethodNotFound,  // Envelope method is not served
        InvalidParams,   // Missing or malformed tools/call fields
        UnknownTool,     // tools/call named a tool that is not registered
        ToolExecution,   // A tool handler failed
        Provider,        // Upstream budgeting service failed (token, HTTP, shape)
        Input,           // Invalid CLI flag or environment value
        Internal         // C++ logic bug or unexpected state
    };

    // The standardized error payload
    struct BudgetError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a BudgetError.
    template <typename T>
    using Result = std::variant<T, BudgetError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BudgetError>(result);
    }

    template <typename T>
    const BudgetError& get_error(const Result<T>& result) {
        return std::get<BudgetError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    // True for faults that leave the byte stream unsynchronized.
    inline bool is_transport_fault(const ErrorCategory category) {
        return category == ErrorCategory::Framing ||
               category == ErrorCategory::Truncated ||
               category == ErrorCategory::Encoding ||
               category == ErrorCategory::Io;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Framing: return "framing";
            case ErrorCategory::Truncated: return "truncated";
            case ErrorCategory::Encoding: return "encoding";
            case ErrorCategory::Io: return "io";
            case ErrorCategory::Parse: return "parse";
            case ErrorCategory::InvalidRequest: return "invalid_request";
            case ErrorCategory::MethodNotFound: return "method_not_found";
            case ErrorCategory::InvalidParams: return "invalid_params";
            case ErrorCategory::UnknownTool: return "unknown_tool";
            case ErrorCategory::ToolExecution: return "tool_execution";
            case ErrorCategory::Provider: return "provider";
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace budget::core::errors
