#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/budget_errors.hpp"

namespace {

using budget::app::cli::parse_and_validate;
using budget::core::config::ServerConfig;
using budget::core::errors::ErrorCategory;
using budget::core::errors::get_error;
using budget::core::errors::get_value;
using budget::core::errors::is_error;
using budget::core::logging::LogLevel;

budget::core::errors::Result<ServerConfig> parse_tokens(
    const std::vector<std::string>& tokens, ServerConfig base = {}) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("budget_mcp");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data(), std::move(base));
}

class TempFile {
public:
    TempFile() {
        path_ = std::filesystem::current_path() /
                (".tmp_cli_parser_" + budget::core::config::generate_session_id() + ".json");
        std::ofstream out(path_);
        out << "[]";
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, ServeWithoutFlagsKeepsBase) {
    auto result = parse_tokens({"serve"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_FALSE(config.transactions_file.has_value());
    EXPECT_EQ(config.base_url, "https://api.ynab.com/v1");
    EXPECT_EQ(config.cache_ttl_seconds, 300u);
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"serve", "--verbose"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"serve", "--cache-ttl"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenCacheTtlNotNumeric) {
    auto result = parse_tokens({"serve", "--cache-ttl", "5m"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenCacheTtlOutOfBounds) {
    auto result = parse_tokens({"serve", "--cache-ttl", "100000"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenMaxMessageBytesZero) {
    auto result = parse_tokens({"serve", "--max-message-bytes", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenTransactionsFileMissing) {
    const auto missing =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test.json";
    auto result = parse_tokens({"serve", "--transactions", missing.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, CategoriesRequireTransactions) {
    TempFile categories;
    auto result = parse_tokens({"serve", "--categories", categories.path()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, TokenAndTransactionsConflict) {
    TempFile transactions;
    ServerConfig base;
    base.api_token = "token-from-env";
    auto result = parse_tokens({"serve", "--transactions", transactions.path()}, base);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_sources");
}

TEST(CliParserTest, FlagsOverrideEnvironmentValues) {
    ServerConfig base;
    base.base_url = "http://from-env";
    base.log_level = LogLevel::WARN;

    auto result = parse_tokens({"serve", "--base-url", "http://from-cli", "--log-level", "debug",
                                "--cache-ttl", "0", "--max-message-bytes", "1024"},
                               base);
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.base_url, "http://from-cli");
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    EXPECT_EQ(config.cache_ttl_seconds, 0u);
    EXPECT_EQ(config.max_message_bytes, 1024u);
}

TEST(CliParserTest, ParsesLocalSourceFiles) {
    TempFile transactions;
    TempFile categories;
    auto result = parse_tokens({"serve", "--transactions", transactions.path(), "--categories",
                                categories.path()});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    ASSERT_TRUE(config.transactions_file.has_value());
    EXPECT_EQ(config.transactions_file->string(), transactions.path());
    ASSERT_TRUE(config.categories_file.has_value());
}

TEST(CliParserTest, RejectsUnknownLogLevel) {
    auto result = parse_tokens({"serve", "--log-level", "loud"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

}  // namespace
