#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/budget_errors.hpp"
#include "domain/category.hpp"
#include "domain/transaction.hpp"
#include "provider/ynab_client.hpp"

namespace budget::tools {

struct BudgetSnapshot {
    domain::Budget budget;
    std::vector<domain::Category> categories;
    std::vector<domain::Transaction> transactions;

    // Category name for an id, or the id itself when unknown.
    std::string category_name(const std::string& category_id) const;
    // Case-insensitive name lookup.
    std::optional<std::string> find_category_id(const std::string& name) const;
};

// Where tool handlers get their data. Chosen once at startup.
class DataSource {
public:
    virtual ~DataSource() = default;

    virtual core::errors::Result<std::shared_ptr<const BudgetSnapshot>> load(
        const std::string& budget_id) const = 0;

    virtual std::string describe() const = 0;
};

// In-memory transactions; the budget_id argument is ignored.
class LocalTransactionSource : public DataSource {
public:
    explicit LocalTransactionSource(std::vector<domain::Transaction> transactions,
                                    std::vector<domain::Category> categories = {});

    // Reads files in the upstream response shapes (see ResponseMapper).
    static core::errors::Result<std::shared_ptr<LocalTransactionSource>> from_files(
        const std::filesystem::path& transactions_file,
        const std::optional<std::filesystem::path>& categories_file);

    core::errors::Result<std::shared_ptr<const BudgetSnapshot>> load(
        const std::string& budget_id) const override;

    std::string describe() const override;

private:
    std::shared_ptr<const BudgetSnapshot> snapshot_;
};

// Fetches budget, categories and transactions in one concurrent batch.
class RemoteProviderSource : public DataSource {
public:
    explicit RemoteProviderSource(std::shared_ptr<const provider::YnabClient> client);

    core::errors::Result<std::shared_ptr<const BudgetSnapshot>> load(
        const std::string& budget_id) const override;

    std::string describe() const override;

private:
    std::shared_ptr<const provider::YnabClient> client_;
};

}  // namespace budget::tools
