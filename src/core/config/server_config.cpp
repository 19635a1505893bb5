#include "core/config/server_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <random>
#include <utility>

namespace budget::core::config {

namespace {

bool is_blank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

std::optional<std::string> process_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

errors::Result<ServerConfig> apply_environment(ServerConfig config,
                                               EnvLookup lookup) {
    auto token = lookup("YNAB_API_TOKEN");
    if (token.has_value() && !is_blank(token.value())) {
        config.api_token = std::move(token);
    }

    auto base_url = lookup("YNAB_BASE_URL");
    if (base_url.has_value() && !is_blank(base_url.value())) {
        config.base_url = base_url.value();
    }

    auto level = lookup("BUDGET_MCP_LOG_LEVEL");
    if (level.has_value() && !is_blank(level.value())) {
        auto parsed = logging::parse_log_level(level.value());
        if (errors::is_error(parsed)) {
            auto err = errors::get_error(parsed);
            err.message = "BUDGET_MCP_LOG_LEVEL: " + err.message;
            return err;
        }
        config.log_level = errors::get_value(parsed);
    }

    return config;
}

std::string generate_session_id() {
    std::random_device entropy;
    std::uniform_int_distribution<std::uint32_t> word;
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "session-%08x", static_cast<unsigned>(word(entropy)));
    return buffer;
}

}  // namespace budget::core::config
