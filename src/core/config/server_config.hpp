#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/budget_errors.hpp"
#include "core/logging/logger.hpp"

namespace budget::core::config {

    inline constexpr const char* kDefaultBaseUrl = "https://api.ynab.com/v1";
    inline constexpr std::uint32_t kDefaultCacheTtlSeconds = 300;
    inline constexpr std::size_t kDefaultMaxMessageBytes = 64 * 1024 * 1024;

    // Validated settings required to start a session
    struct ServerConfig {
        std::optional<std::string> api_token;                 // Selects the remote provider
        std::string base_url = kDefaultBaseUrl;
        std::optional<std::filesystem::path> transactions_file; // Selects the local source
        std::optional<std::filesystem::path> categories_file;
        std::uint32_t cache_ttl_seconds = kDefaultCacheTtlSeconds;
        std::uint32_t http_timeout_ms = 15000;
        std::size_t max_message_bytes = kDefaultMaxMessageBytes;
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

    // Environment lookup seam so tests do not touch the process environment.
    using EnvLookup = std::optional<std::string> (*)(const char* name);

    std::optional<std::string> process_env(const char* name);

    // Overlays YNAB_API_TOKEN, YNAB_BASE_URL and BUDGET_MCP_LOG_LEVEL onto config.
    // CLI flags are applied afterwards and take precedence.
    errors::Result<ServerConfig> apply_environment(ServerConfig config,
                                                   EnvLookup lookup = process_env);

    // "session-" plus 8 lowercase hex digits; tags every log line of one stdio session.
    std::string generate_session_id();

} // namespace budget::core::config
