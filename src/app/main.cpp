#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/budget_errors.hpp"
#include "core/logging/logger.hpp"
#include "provider/api_response_cache.hpp"
#include "provider/http_fetcher.hpp"
#include "provider/ynab_client.hpp"
#include "server/protocol_dispatcher.hpp"
#include "server/session_loop.hpp"
#include "tools/budget_tools.hpp"
#include "tools/data_source.hpp"
#include "tools/tool_registry.hpp"

namespace {

void log_error(const std::string& context, const budget::core::errors::BudgetError& err) {
    LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

budget::core::errors::Result<std::shared_ptr<const budget::tools::DataSource>> make_data_source(
    const budget::core::config::ServerConfig& config) {
    if (config.api_token.has_value() && !config.api_token->empty()) {
        auto fetcher = std::make_shared<budget::provider::CurlHttpFetcher>(config.http_timeout_ms);
        auto cache = std::make_shared<budget::provider::ApiResponseCache>(
            std::chrono::seconds(config.cache_ttl_seconds));
        auto client = std::make_shared<budget::provider::YnabClient>(
            config.api_token.value(), fetcher, config.base_url, cache);
        return std::shared_ptr<const budget::tools::DataSource>(
            std::make_shared<budget::tools::RemoteProviderSource>(client));
    }

    if (config.transactions_file.has_value()) {
        auto local = budget::tools::LocalTransactionSource::from_files(
            config.transactions_file.value(), config.categories_file);
        if (budget::core::errors::is_error(local)) {
            return budget::core::errors::get_error(local);
        }
        return std::shared_ptr<const budget::tools::DataSource>(
            budget::core::errors::get_value(local));
    }

    LOG_WARN("No YNAB_API_TOKEN or --transactions given; serving an empty local source");
    return std::shared_ptr<const budget::tools::DataSource>(
        std::make_shared<budget::tools::LocalTransactionSource>(
            std::vector<budget::domain::Transaction>{}));
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Generate a Session ID and register it with the Global Logger
    const std::string session_id = budget::core::config::generate_session_id();
    budget::core::logging::Logger::get().set_session_id(session_id);

    // 2. Environment first, then CLI flags on top
    LOG_INFO("budget_mcp: bootstrapping...");
    auto from_env = budget::core::config::apply_environment(budget::core::config::ServerConfig{});
    if (budget::core::errors::is_error(from_env)) {
        log_error("Configuration error", budget::core::errors::get_error(from_env));
        return 2;
    }

    auto parsed = budget::app::cli::parse_and_validate(
        argc, argv, budget::core::errors::get_value(from_env));
    if (budget::core::errors::is_error(parsed)) {
        log_error("Input error", budget::core::errors::get_error(parsed));
        return 2;
    }
    const auto& config = budget::core::errors::get_value(parsed);
    budget::core::logging::Logger::get().set_min_level(config.log_level);

    // 3. Data source, tools and dispatcher
    auto source = make_data_source(config);
    if (budget::core::errors::is_error(source)) {
        log_error("Failed to load data source", budget::core::errors::get_error(source));
        return 3;
    }
    LOG_INFO("Data source: " + budget::core::errors::get_value(source)->describe());

    auto registry = std::make_shared<budget::tools::ToolRegistry>();
    auto tools = std::make_shared<budget::tools::BudgetTools>(
        budget::core::errors::get_value(source));
    auto registered = budget::tools::register_budget_tools(*registry, tools);
    if (budget::core::errors::is_error(registered)) {
        log_error("Failed to register tools", budget::core::errors::get_error(registered));
        return 3;
    }

    auto dispatcher = std::make_shared<budget::server::ProtocolDispatcher>(registry);
    budget::server::SessionLoop session(dispatcher, config.max_message_bytes);

    // 4. Serve stdin/stdout until the client closes the stream
    LOG_INFO("Serving " + std::to_string(budget::core::errors::get_value(registered)) +
             " tools on stdio");
    auto result = session.run(std::cin, std::cout);
    if (budget::core::errors::is_error(result)) {
        log_error("Session ended with a transport fault", budget::core::errors::get_error(result));
        return 1;
    }

    const auto& summary = budget::core::errors::get_value(result);
    LOG_INFO("Session closed: " + std::to_string(summary.messages_read) + " messages read, " +
             std::to_string(summary.responses_written) + " responses written (" +
             std::to_string(summary.error_responses) + " errors)");
    return 0;
}
