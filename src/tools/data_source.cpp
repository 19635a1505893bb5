#include "tools/data_source.hpp"

#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "provider/response_mapper.hpp"
#include "query/transaction_query.hpp"

namespace budget::tools {

using core::errors::BudgetError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

core::errors::Result<json> read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return BudgetError{ErrorCategory::Input, "Failed to open file: " + path.string(),
                           "file_open_failed"};
    }
    json payload = json::parse(in, nullptr, false);
    if (payload.is_discarded()) {
        return BudgetError{ErrorCategory::Input, "File is not valid JSON: " + path.string(),
                           "invalid_json_file"};
    }
    return payload;
}

// Provider failures keep their category; anything else is re-tagged so the
// dispatcher sees one error surface for upstream problems.
BudgetError as_provider_error(BudgetError error, const std::string& what) {
    error.category = ErrorCategory::Provider;
    error.message = what + ": " + error.message;
    return error;
}

}  // namespace

std::string BudgetSnapshot::category_name(const std::string& category_id) const {
    for (const auto& category : categories) {
        if (category.id == category_id) {
            return category.name;
        }
    }
    return category_id;
}

std::optional<std::string> BudgetSnapshot::find_category_id(const std::string& name) const {
    const std::string wanted = query::to_lower_ascii(name);
    for (const auto& category : categories) {
        if (query::to_lower_ascii(category.name) == wanted) {
            return category.id;
        }
    }
    return std::nullopt;
}

LocalTransactionSource::LocalTransactionSource(std::vector<domain::Transaction> transactions,
                                               std::vector<domain::Category> categories)
    : snapshot_(std::make_shared<BudgetSnapshot>(
          BudgetSnapshot{domain::Budget{"local", "Local transactions"}, std::move(categories),
                         std::move(transactions)})) {}

core::errors::Result<std::shared_ptr<LocalTransactionSource>> LocalTransactionSource::from_files(
    const std::filesystem::path& transactions_file,
    const std::optional<std::filesystem::path>& categories_file) {
    const provider::ResponseMapper mapper;

    auto transactions_json = read_json_file(transactions_file);
    if (core::errors::is_error(transactions_json)) {
        return core::errors::get_error(transactions_json);
    }
    auto transactions =
        mapper.map_transactions_from_response(core::errors::get_value(transactions_json));
    if (core::errors::is_error(transactions)) {
        auto err = core::errors::get_error(transactions);
        err.category = ErrorCategory::Input;
        err.message = transactions_file.string() + ": " + err.message;
        return err;
    }

    std::vector<domain::Category> categories;
    if (categories_file.has_value()) {
        auto categories_json = read_json_file(categories_file.value());
        if (core::errors::is_error(categories_json)) {
            return core::errors::get_error(categories_json);
        }
        auto mapped =
            mapper.map_categories_from_response(core::errors::get_value(categories_json));
        if (core::errors::is_error(mapped)) {
            auto err = core::errors::get_error(mapped);
            err.category = ErrorCategory::Input;
            err.message = categories_file->string() + ": " + err.message;
            return err;
        }
        categories = core::errors::get_value(mapped);
    }

    LOG_INFO("LocalTransactionSource: loaded " +
             std::to_string(core::errors::get_value(transactions).size()) +
             " transactions and " + std::to_string(categories.size()) + " categories");
    return std::make_shared<LocalTransactionSource>(
        core::errors::take_value(std::move(transactions)), std::move(categories));
}

core::errors::Result<std::shared_ptr<const BudgetSnapshot>> LocalTransactionSource::load(
    const std::string& /*budget_id*/) const {
    return snapshot_;
}

std::string LocalTransactionSource::describe() const {
    return "local (" + std::to_string(snapshot_->transactions.size()) + " transactions)";
}

RemoteProviderSource::RemoteProviderSource(std::shared_ptr<const provider::YnabClient> client)
    : client_(std::move(client)) {}

core::errors::Result<std::shared_ptr<const BudgetSnapshot>> RemoteProviderSource::load(
    const std::string& budget_id) const {
    if (!client_) {
        return BudgetError{ErrorCategory::Internal, "Remote source has no client",
                           "missing_client"};
    }

    auto batch = client_->get_budget_batch(budget_id);
    if (core::errors::is_error(batch.budget)) {
        return as_provider_error(core::errors::get_error(batch.budget), "Fetching budget");
    }
    if (core::errors::is_error(batch.categories)) {
        return as_provider_error(core::errors::get_error(batch.categories),
                                 "Fetching categories");
    }
    if (core::errors::is_error(batch.transactions)) {
        return as_provider_error(core::errors::get_error(batch.transactions),
                                 "Fetching transactions");
    }

    const provider::ResponseMapper mapper;
    auto budget = mapper.map_budget_from_response(core::errors::get_value(batch.budget));
    if (core::errors::is_error(budget)) {
        return core::errors::get_error(budget);
    }
    auto categories =
        mapper.map_categories_from_response(core::errors::get_value(batch.categories));
    if (core::errors::is_error(categories)) {
        return core::errors::get_error(categories);
    }
    auto transactions =
        mapper.map_transactions_from_response(core::errors::get_value(batch.transactions));
    if (core::errors::is_error(transactions)) {
        return core::errors::get_error(transactions);
    }

    auto snapshot = std::make_shared<BudgetSnapshot>();
    snapshot->budget = core::errors::take_value(std::move(budget));
    snapshot->categories = core::errors::take_value(std::move(categories));
    snapshot->transactions = core::errors::take_value(std::move(transactions));
    return std::shared_ptr<const BudgetSnapshot>(std::move(snapshot));
}

std::string RemoteProviderSource::describe() const {
    return client_ ? "remote (" + client_->base_url() + ")" : "remote (unconfigured)";
}

}  // namespace budget::tools
