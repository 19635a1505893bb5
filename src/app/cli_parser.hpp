#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/budget_errors.hpp"

namespace budget::app::cli {
    // Applies `serve` flags on top of `base` (defaults plus environment).
    budget::core::errors::Result<budget::core::config::ServerConfig> parse_and_validate(
        int argc, char* argv[], budget::core::config::ServerConfig base = {});
}
