#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace budget::app::cli {

    using namespace budget::core::errors;
    using budget::core::config::ServerConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> transactions;
        std::optional<std::string> categories;
        std::optional<std::string> base_url;
        std::optional<std::string> cache_ttl;
        std::optional<std::string> max_message_bytes;
        std::optional<std::string> log_level;
    };

    namespace {

        template <typename T>
        Result<T> parse_unsigned(const std::string& text, const std::string& flag) {
            T value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (text.empty() || ec != std::errc() || ptr != end) {
                return BudgetError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            return value;
        }

        Result<std::filesystem::path> existing_file(const std::string& text, const std::string& flag) {
            std::filesystem::path p(text);
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return BudgetError{ErrorCategory::Input, flag + " file does not exist or is not a regular file: " + text, "invalid_path"};
            }
            return p;
        }

    } // namespace

    Result<ServerConfig> parse_and_validate(int argc, char* argv[], ServerConfig base) {
        if (argc < 2) {
            return BudgetError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: budget_mcp serve [--transactions FILE]"};
        }

        std::string command = argv[1];
        if (command != "serve") {
            return BudgetError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'serve' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'serve' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* slot = nullptr;
            if (args[i] == "--transactions") slot = &raw.transactions;
            else if (args[i] == "--categories") slot = &raw.categories;
            else if (args[i] == "--base-url") slot = &raw.base_url;
            else if (args[i] == "--cache-ttl") slot = &raw.cache_ttl;
            else if (args[i] == "--max-message-bytes") slot = &raw.max_message_bytes;
            else if (args[i] == "--log-level") slot = &raw.log_level;
            else {
                return BudgetError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }

            if (i + 1 >= args.size()) {
                return BudgetError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            *slot = args[++i];
        }

        // 3. Validator Phase: CLI values override the environment
        ServerConfig config = std::move(base);

        if (raw.transactions) {
            auto path = existing_file(raw.transactions.value(), "--transactions");
            if (is_error(path)) return get_error(path);
            config.transactions_file = get_value(path);
        }
        if (raw.categories) {
            auto path = existing_file(raw.categories.value(), "--categories");
            if (is_error(path)) return get_error(path);
            config.categories_file = get_value(path);
        }
        if (config.categories_file.has_value() && !config.transactions_file.has_value()) {
            return BudgetError{ErrorCategory::Input, "--categories requires --transactions", "missing_required_flag"};
        }

        // A local file and a provider token select different sources
        const bool has_token = config.api_token.has_value() && !config.api_token->empty();
        if (has_token && config.transactions_file.has_value()) {
            return BudgetError{ErrorCategory::Input, "Cannot use both YNAB_API_TOKEN and --transactions", "conflicting_sources", "Unset YNAB_API_TOKEN to serve a local file."};
        }

        if (raw.base_url) {
            if (raw.base_url->empty()) {
                return BudgetError{ErrorCategory::Input, "--base-url must not be empty", "invalid_url"};
            }
            config.base_url = raw.base_url.value();
        }

        // Exception-free integer parsing
        if (raw.cache_ttl) {
            auto ttl = parse_unsigned<std::uint32_t>(raw.cache_ttl.value(), "--cache-ttl");
            if (is_error(ttl)) return get_error(ttl);
            if (get_value(ttl) > 86400) {
                return BudgetError{ErrorCategory::Input, "--cache-ttl out of bounds", "bounds_error", "Must be between 0 and 86400 seconds."};
            }
            config.cache_ttl_seconds = get_value(ttl);
        }

        if (raw.max_message_bytes) {
            auto bytes = parse_unsigned<std::size_t>(raw.max_message_bytes.value(), "--max-message-bytes");
            if (is_error(bytes)) return get_error(bytes);
            if (get_value(bytes) == 0) {
                return BudgetError{ErrorCategory::Input, "--max-message-bytes out of bounds", "bounds_error", "Must be at least 1."};
            }
            config.max_message_bytes = get_value(bytes);
        }

        if (raw.log_level) {
            auto level = budget::core::logging::parse_log_level(raw.log_level.value());
            if (is_error(level)) return get_error(level);
            config.log_level = get_value(level);
        }

        return config;
    }

} // namespace budget::app::cli
