#include "server/session_loop.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace budget::server {

using core::errors::BudgetError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Response;

SessionLoop::SessionLoop(std::shared_ptr<const ProtocolDispatcher> dispatcher,
                         const std::size_t max_message_bytes)
    : dispatcher_(std::move(dispatcher)), max_message_bytes_(max_message_bytes) {}

std::string SessionLoop::to_string(const SessionState state) {
    switch (state) {
        case SessionState::Idle:
            return "idle";
        case SessionState::Reading:
            return "reading";
        case SessionState::Parsed:
            return "parsed";
        case SessionState::Dispatching:
            return "dispatching";
        case SessionState::Responding:
            return "responding";
        case SessionState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

void SessionLoop::transition(const SessionState next) {
    LOG_DEBUG("SessionLoop: transition " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

core::errors::Result<SessionSummary> SessionLoop::run(std::istream& in, std::ostream& out) {
    if (!dispatcher_) {
        return BudgetError{ErrorCategory::Internal, "Session has no dispatcher",
                           "missing_dispatcher"};
    }
    if (state_ == SessionState::Closed) {
        return BudgetError{ErrorCategory::Internal, "Session is already closed",
                           "session_closed"};
    }

    summary_ = SessionSummary{};
    while (true) {
        transition(SessionState::Reading);
        auto frame = transport::read_message(in, max_message_bytes_);
        if (core::errors::is_error(frame)) {
            const auto& err = core::errors::get_error(frame);
            LOG_ERROR("SessionLoop: transport fault [" + core::errors::to_string(err.category) +
                      "]: " + err.message);
            transition(SessionState::Closed);
            return err;
        }
        if (!core::errors::get_value(frame).has_value()) {
            LOG_INFO("SessionLoop: end of stream after " +
                     std::to_string(summary_.messages_read) + " messages");
            transition(SessionState::Closed);
            return summary_;
        }

        ++summary_.messages_read;
        const std::string& body = core::errors::get_value(frame).value();

        auto parsed = protocol::parse_request(body);
        if (core::errors::is_error(parsed)) {
            const auto& err = core::errors::get_error(parsed);
            LOG_WARN("SessionLoop: rejected message: " + err.message);
            // Syntax and envelope faults alike answer as a parse error with a null id.
            transition(SessionState::Responding);
            auto written = write_response(
                out, protocol::build_error(json(nullptr), protocol::rpc_codes::kParseError,
                                           err.message, json{{"code", err.code}}));
            if (core::errors::is_error(written)) {
                return core::errors::get_error(written);
            }
            transition(SessionState::Idle);
            continue;
        }

        transition(SessionState::Parsed);
        const protocol::Request& request = core::errors::get_value(parsed);
        const json id = request.id.value_or(json(nullptr));

        transition(SessionState::Dispatching);
        std::optional<Response> response;
        try {
            auto dispatched = dispatcher_->dispatch(request);
            if (core::errors::is_error(dispatched)) {
                const auto& err = core::errors::get_error(dispatched);
                LOG_ERROR("SessionLoop: dispatch failed: " + err.message);
                response = protocol::build_error(id, protocol::rpc_codes::kInternalError,
                                                 "Internal error", json{{"code", err.code}});
            } else {
                response = core::errors::get_value(dispatched);
            }
        } catch (const std::exception& ex) {
            LOG_ERROR("SessionLoop: exception while dispatching " + request.method + ": " +
                      ex.what());
            response = protocol::build_error(id, protocol::rpc_codes::kInternalError,
                                             "Internal error",
                                             json{{"code", "unhandled_exception"}});
        }

        if (request.is_notification()) {
            LOG_DEBUG("SessionLoop: notification " + request.method + " handled, no response");
            transition(SessionState::Idle);
            continue;
        }

        transition(SessionState::Responding);
        auto written = write_response(out, response.value());
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
        transition(SessionState::Idle);
    }
}

core::errors::Result<bool> SessionLoop::write_response(std::ostream& out,
                                                       const Response& response) {
    auto written = transport::write_message(out, protocol::serialize(response));
    if (core::errors::is_error(written)) {
        LOG_ERROR("SessionLoop: write failed: " + core::errors::get_error(written).message);
        transition(SessionState::Closed);
        return core::errors::get_error(written);
    }
    ++summary_.responses_written;
    if (response.is_error()) {
        ++summary_.error_responses;
    }
    return true;
}

}  // namespace budget::server
