#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "server/protocol_dispatcher.hpp"
#include "server/session_loop.hpp"
#include "tools/budget_tools.hpp"
#include "tools/data_source.hpp"
#include "tools/tool_registry.hpp"
#include "transport/framed_transport.hpp"

namespace {

using budget::core::errors::ErrorCategory;
using budget::core::errors::get_error;
using budget::core::errors::get_value;
using budget::core::errors::is_error;
using budget::domain::Transaction;
using budget::server::ProtocolDispatcher;
using budget::server::SessionLoop;
using budget::server::SessionState;
using nlohmann::json;

std::string frame(const std::string& body) {
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

std::string request(int id, const std::string& method, const json& params = nullptr) {
    json message = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        message["params"] = params;
    }
    return frame(message.dump());
}

// Decodes every frame the session wrote.
std::vector<json> responses_in(const std::string& written) {
    std::istringstream in(written);
    std::vector<json> out;
    while (true) {
        auto message = budget::transport::read_message(in);
        if (is_error(message) || !get_value(message).has_value()) {
            break;
        }
        out.push_back(json::parse(get_value(message).value()));
    }
    return out;
}

std::shared_ptr<ProtocolDispatcher> make_dispatcher() {
    Transaction coffee;
    coffee.id = "t1";
    coffee.category_id = "c-coffee";
    coffee.amount = -4500;
    coffee.date = "2024-05-02";
    coffee.description = "Espresso bar";

    auto source = std::make_shared<budget::tools::LocalTransactionSource>(
        std::vector<Transaction>{coffee});
    auto registry = std::make_shared<budget::tools::ToolRegistry>();
    auto registered = budget::tools::register_budget_tools(
        *registry, std::make_shared<budget::tools::BudgetTools>(source));
    EXPECT_FALSE(is_error(registered));
    return std::make_shared<ProtocolDispatcher>(registry);
}

TEST(SessionLoopTest, ServesRequestsUntilEndOfStream) {
    std::istringstream in(request(1, "initialize") + request(2, "tools/list") +
                          request(3, "tools/call", {{"name", "search_transactions"},
                                                    {"arguments", {{"query", "espresso"}}}}));
    std::ostringstream out;
    SessionLoop session(make_dispatcher());

    auto result = session.run(in, out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).messages_read, 3u);
    EXPECT_EQ(get_value(result).responses_written, 3u);
    EXPECT_EQ(get_value(result).error_responses, 0u);
    EXPECT_EQ(session.state(), SessionState::Closed);

    const auto responses = responses_in(out.str());
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["result"]["tools"].size(), 5u);

    const json tool_output =
        json::parse(responses[2]["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(tool_output["transactions"]["total_matches"], 1);
}

TEST(SessionLoopTest, EmptyInputClosesCleanly) {
    std::istringstream in("");
    std::ostringstream out;
    SessionLoop session(make_dispatcher());

    auto result = session.run(in, out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).messages_read, 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST(SessionLoopTest, BadJsonGetsParseErrorAndSessionContinues) {
    std::istringstream in(frame("{oops") + request(9, "initialize"));
    std::ostringstream out;
    SessionLoop session(make_dispatcher());

    auto result = session.run(in, out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).error_responses, 1u);

    const auto responses = responses_in(out.str());
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_TRUE(responses[0]["id"].is_null());
    EXPECT_EQ(responses[0]["error"]["code"], -32700);
    EXPECT_EQ(responses[1]["id"], 9);
    EXPECT_TRUE(responses[1].contains("result"));
}

TEST(SessionLoopTest, MalformedBodyGetsNullIdParseErrorAndSessionContinues) {
    std::istringstream in(frame(R"({"invalid":json)") + request(2, "tools/list"));
    std::ostringstream out;
    SessionLoop session(make_dispatcher());

    auto result = session.run(in, out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).messages_read, 2u);

    const auto responses = responses_in(out.str());
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_TRUE(responses[0]["id"].is_null());
    EXPECT_EQ(responses[0]["error"]["code"], -32700);
    EXPECT_EQ(responses[1]["id"], 2);
    EXPECT_EQ(responses[1]["result"]["tools"].size(), 5u);
}

TEST(SessionLoopTest, IncompleteEnvelopeIsParseErrorWithNullId) {
    std::istringstream in(frame(R"({"jsonrpc":"2.0","id":7})") +
                          frame(R"({"id":8,"method":"tools/list"})") +
                          frame(R"({"jsonrpc":"2.0","id":"x-1","method":""})"));
    std::ostringstream out;
    SessionLoop session(make_dispatcher());

    auto result = session.run(in, out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).error_responses, 3u);

    const auto responses = responses_in(out.str());
    ASSERT_EQ(responses.size(), 3u);
    for (const auto& response : responses) {
        EXPECT_TRUE(response["id"].is_null()) << response.dump();
        EXPECT_EQ(response["error"]["code"], -32700) << response.dump();
    }
    EXPECT_EQ(responses[0]["error"]["message"], "Missing method field");
    EXPECT_EQ(responses[0]["error"]["data"]["code"], "invalid_request");
}

TEST(SessionLoopTest, UnknownMethodAndToolErrorsKeepSessionAlive) {
    std::istringstream in(request(1, "prompts/list") +
                          request(2, "tools/call", {{"name", "no_such_tool"}}) +
                          request(3, "tools/list"));
    std::ostringstream out;
    SessionLoop session(make_dispatcher());

    auto result = session.run(in, out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).error_responses, 2u);

    const auto responses = responses_in(out.str());
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["error"]["code"], -32601);
    EXPECT_EQ(responses[1]["error"]["code"], -32000);
    EXPECT_TRUE(responses[2].contains("result"));
}

TEST(SessionLoopTest, NotificationsGetNoResponse) {
    const std::string notification =
        frame(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    std::istringstream in(notification + request(1, "tools/list"));
    std::ostringstream out;
    SessionLoop session(make_dispatcher());

    auto result = session.run(in, out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).messages_read, 2u);
    EXPECT_EQ(get_value(result).responses_written, 1u);

    const auto responses = responses_in(out.str());
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["id"], 1);
}

TEST(SessionLoopTest, FramingFaultEndsSessionWithoutResponse) {
    std::istringstream in(request(1, "initialize") + "Bogus: 12\r\n\r\n{}");
    std::ostringstream out;
    SessionLoop session(make_dispatcher());

    auto result = session.run(in, out);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Framing);
    EXPECT_EQ(responses_in(out.str()).size(), 1u);
    EXPECT_EQ(session.state(), SessionState::Closed);
}

TEST(SessionLoopTest, TruncatedBodyEndsSession) {
    std::istringstream in("Content-Length: 50\r\n\r\n{\"jsonrpc\":\"2.0\"}");
    std::ostringstream out;
    SessionLoop session(make_dispatcher());

    auto result = session.run(in, out);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Truncated);
    EXPECT_TRUE(out.str().empty());
}

TEST(SessionLoopTest, OversizedFrameIsRejectedByConfiguredLimit) {
    std::istringstream in(request(1, "initialize"));
    std::ostringstream out;
    SessionLoop session(make_dispatcher(), 8);

    auto result = session.run(in, out);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "content_length_too_large");
}

TEST(SessionLoopTest, WriteFailureEndsSessionWithIoError) {
    std::istringstream in(request(1, "initialize"));
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    SessionLoop session(make_dispatcher());

    auto result = session.run(in, out);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Io);
}

TEST(SessionLoopTest, ClosedSessionCannotRunAgain) {
    std::istringstream in("");
    std::ostringstream out;
    SessionLoop session(make_dispatcher());
    ASSERT_FALSE(is_error(session.run(in, out)));

    auto again = session.run(in, out);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "session_closed");
}

TEST(SessionLoopTest, StateNames) {
    EXPECT_EQ(SessionLoop::to_string(SessionState::Idle), "idle");
    EXPECT_EQ(SessionLoop::to_string(SessionState::Dispatching), "dispatching");
    EXPECT_EQ(SessionLoop::to_string(SessionState::Closed), "closed");
}

}  // namespace
