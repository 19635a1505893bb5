#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "core/errors/budget_errors.hpp"
#include "provider/api_response_cache.hpp"
#include "provider/http_fetcher.hpp"

namespace budget::provider {

struct BudgetBatch {
    core::errors::Result<nlohmann::json> budget;
    core::errors::Result<nlohmann::json> categories;
    core::errors::Result<nlohmann::json> transactions;
};

// Read-only client for the upstream budgeting API. Responses are cached by
// path; every call is fallible and reports failures as Provider errors.
class YnabClient {
public:
    YnabClient(std::string api_token, std::shared_ptr<const HttpFetcher> fetcher,
               std::string base_url = core::config::kDefaultBaseUrl,
               std::shared_ptr<ApiResponseCache> cache = nullptr);

    const std::string& api_token() const { return api_token_; }
    const std::string& base_url() const { return base_url_; }

    core::errors::Result<bool> validate_token() const;

    core::errors::Result<nlohmann::json> get_json(const std::string& path) const;

    core::errors::Result<nlohmann::json> get_budgets() const;
    core::errors::Result<nlohmann::json> get_budget(const std::string& budget_id) const;
    core::errors::Result<nlohmann::json> get_categories(const std::string& budget_id) const;
    core::errors::Result<nlohmann::json> get_transactions(const std::string& budget_id) const;

    // Fetches all paths concurrently. Output order matches input order and a
    // failed slot does not affect its siblings.
    std::vector<core::errors::Result<nlohmann::json>> batch(
        const std::vector<std::string>& paths) const;

    BudgetBatch get_budget_batch(const std::string& budget_id) const;

    void clear_cache() const;
    std::size_t cache_size() const;
    std::size_t cleanup_cache() const;

private:
    core::errors::Result<std::string> budget_path(const std::string& budget_id,
                                                  const std::string& suffix) const;

    std::string api_token_;
    std::shared_ptr<const HttpFetcher> fetcher_;
    std::string base_url_;
    std::shared_ptr<ApiResponseCache> cache_;
};

}  // namespace budget::provider
