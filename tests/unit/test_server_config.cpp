#include <cstring>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/server_config.hpp"

namespace {

using budget::core::config::apply_environment;
using budget::core::config::ServerConfig;
using budget::core::errors::ErrorCategory;
using budget::core::errors::get_error;
using budget::core::errors::get_value;
using budget::core::errors::is_error;
using budget::core::logging::LogLevel;

std::optional<std::string> empty_env(const char*) {
    return std::nullopt;
}

std::optional<std::string> full_env(const char* name) {
    if (std::strcmp(name, "YNAB_API_TOKEN") == 0) return std::string("token-123");
    if (std::strcmp(name, "YNAB_BASE_URL") == 0) return std::string("http://localhost:9000/v1");
    if (std::strcmp(name, "BUDGET_MCP_LOG_LEVEL") == 0) return std::string("debug");
    return std::nullopt;
}

std::optional<std::string> blank_token_env(const char* name) {
    if (std::strcmp(name, "YNAB_API_TOKEN") == 0) return std::string("   ");
    return std::nullopt;
}

std::optional<std::string> bad_level_env(const char* name) {
    if (std::strcmp(name, "BUDGET_MCP_LOG_LEVEL") == 0) return std::string("verbose");
    return std::nullopt;
}

TEST(ServerConfigTest, DefaultsWithoutEnvironment) {
    auto result = apply_environment(ServerConfig{}, empty_env);
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_FALSE(config.api_token.has_value());
    EXPECT_EQ(config.base_url, "https://api.ynab.com/v1");
    EXPECT_EQ(config.cache_ttl_seconds, 300u);
    EXPECT_EQ(config.max_message_bytes, 64u * 1024u * 1024u);
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST(ServerConfigTest, OverlaysEnvironmentValues) {
    auto result = apply_environment(ServerConfig{}, full_env);
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    ASSERT_TRUE(config.api_token.has_value());
    EXPECT_EQ(config.api_token.value(), "token-123");
    EXPECT_EQ(config.base_url, "http://localhost:9000/v1");
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(ServerConfigTest, BlankTokenIsIgnored) {
    auto result = apply_environment(ServerConfig{}, blank_token_env);
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).api_token.has_value());
}

TEST(ServerConfigTest, RejectsUnknownLogLevel) {
    auto result = apply_environment(ServerConfig{}, bad_level_env);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(SessionIdTest, HasPrefixAndEightHexDigits) {
    const std::string id = budget::core::config::generate_session_id();
    ASSERT_EQ(id.size(), std::string("session-").size() + 8);
    EXPECT_EQ(id.rfind("session-", 0), 0u);
    for (std::size_t i = 8; i < id.size(); ++i) {
        EXPECT_NE(std::string("0123456789abcdef").find(id[i]), std::string::npos);
    }
}

}  // namespace
