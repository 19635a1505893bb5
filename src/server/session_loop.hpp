#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include "core/errors/budget_errors.hpp"
#include "protocol/jsonrpc_envelope.hpp"
#include "server/protocol_dispatcher.hpp"
#include "transport/framed_transport.hpp"

namespace budget::server {

enum class SessionState {
    Idle,
    Reading,
    Parsed,
    Dispatching,
    Responding,
    Closed
};

struct SessionSummary {
    std::size_t messages_read = 0;
    std::size_t responses_written = 0;
    std::size_t error_responses = 0;
};

// Sequential read, parse, dispatch, write loop over one stream pair.
class SessionLoop {
public:
    explicit SessionLoop(std::shared_ptr<const ProtocolDispatcher> dispatcher,
                         std::size_t max_message_bytes = transport::kDefaultMaxBodyBytes);

    // Runs until end-of-stream (success) or a transport fault (error).
    core::errors::Result<SessionSummary> run(std::istream& in, std::ostream& out);

    SessionState state() const { return state_; }

    static std::string to_string(SessionState state);

private:
    void transition(SessionState next);
    core::errors::Result<bool> write_response(std::ostream& out,
                                              const protocol::Response& response);

    std::shared_ptr<const ProtocolDispatcher> dispatcher_;
    std::size_t max_message_bytes_;
    SessionState state_ = SessionState::Idle;
    SessionSummary summary_;
};

}  // namespace budget::server
