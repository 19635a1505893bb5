#include "provider/ynab_client.hpp"

#include <future>
#include <utility>
#include "core/logging/logger.hpp"

namespace budget::provider {

using core::errors::BudgetError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

bool is_blank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

}  // namespace

YnabClient::YnabClient(std::string api_token, std::shared_ptr<const HttpFetcher> fetcher,
                       std::string base_url, std::shared_ptr<ApiResponseCache> cache)
    : api_token_(std::move(api_token)),
      fetcher_(std::move(fetcher)),
      base_url_(strip_trailing_slash(std::move(base_url))),
      cache_(cache ? std::move(cache) : std::make_shared<ApiResponseCache>()) {}

core::errors::Result<bool> YnabClient::validate_token() const {
    if (is_blank(api_token_)) {
        return BudgetError{ErrorCategory::Provider, "API token cannot be empty",
                           "invalid_api_token", "Set YNAB_API_TOKEN to a personal access token."};
    }
    return true;
}

core::errors::Result<json> YnabClient::get_json(const std::string& path) const {
    auto token_check = validate_token();
    if (core::errors::is_error(token_check)) {
        return core::errors::get_error(token_check);
    }
    if (!fetcher_) {
        return BudgetError{ErrorCategory::Internal, "YnabClient has no HTTP fetcher",
                           "missing_fetcher"};
    }

    if (auto cached = cache_->get(path)) {
        LOG_DEBUG("YnabClient: cache hit " + path);
        return std::move(cached.value());
    }

    const std::string url = base_url_ + path;
    auto fetched = fetcher_->get(url, {"Authorization: Bearer " + api_token_});
    if (core::errors::is_error(fetched)) {
        return core::errors::get_error(fetched);
    }
    const auto& response = core::errors::get_value(fetched);

    if (response.status == 401) {
        return BudgetError{ErrorCategory::Provider, "HTTP 401 for " + url, "invalid_api_token",
                           "The API token was rejected; generate a new one."};
    }
    if (response.status < 200 || response.status >= 300) {
        return BudgetError{ErrorCategory::Provider,
                           "HTTP " + std::to_string(response.status) + " for " + url,
                           "http_status"};
    }

    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded()) {
        return BudgetError{ErrorCategory::Provider, "Response is not valid JSON: " + url,
                           "invalid_response_json"};
    }

    cache_->set(path, body);
    return body;
}

core::errors::Result<std::string> YnabClient::budget_path(const std::string& budget_id,
                                                          const std::string& suffix) const {
    if (is_blank(budget_id) || budget_id.find('/') != std::string::npos) {
        return BudgetError{ErrorCategory::Provider, "Invalid budget ID: " + budget_id,
                           "invalid_budget_id", "Pass a budget_id or \"last-used\"."};
    }
    return "/budgets/" + budget_id + suffix;
}

core::errors::Result<json> YnabClient::get_budgets() const {
    return get_json("/budgets");
}

core::errors::Result<json> YnabClient::get_budget(const std::string& budget_id) const {
    auto path = budget_path(budget_id, "");
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    return get_json(core::errors::get_value(path));
}

core::errors::Result<json> YnabClient::get_categories(const std::string& budget_id) const {
    auto path = budget_path(budget_id, "/categories");
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    return get_json(core::errors::get_value(path));
}

core::errors::Result<json> YnabClient::get_transactions(const std::string& budget_id) const {
    auto path = budget_path(budget_id, "/transactions");
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    return get_json(core::errors::get_value(path));
}

std::vector<core::errors::Result<json>> YnabClient::batch(
    const std::vector<std::string>& paths) const {
    std::vector<std::future<core::errors::Result<json>>> pending;
    pending.reserve(paths.size());
    for (const auto& path : paths) {
        pending.push_back(
            std::async(std::launch::async, [this, path]() { return get_json(path); }));
    }

    std::vector<core::errors::Result<json>> results;
    results.reserve(pending.size());
    for (auto& future : pending) {
        results.push_back(future.get());
    }
    return results;
}

BudgetBatch YnabClient::get_budget_batch(const std::string& budget_id) const {
    auto budget = budget_path(budget_id, "");
    if (core::errors::is_error(budget)) {
        const auto& err = core::errors::get_error(budget);
        return BudgetBatch{err, err, err};
    }
    const std::string base = core::errors::get_value(budget);

    auto results = batch({base, base + "/categories", base + "/transactions"});
    return BudgetBatch{std::move(results[0]), std::move(results[1]), std::move(results[2])};
}

void YnabClient::clear_cache() const {
    cache_->clear();
}

std::size_t YnabClient::cache_size() const {
    return cache_->size();
}

std::size_t YnabClient::cleanup_cache() const {
    return cache_->cleanup_expired();
}

}  // namespace budget::provider
