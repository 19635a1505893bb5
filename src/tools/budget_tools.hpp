#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/budget_errors.hpp"
#include "tools/data_source.hpp"
#include "tools/tool_registry.hpp"

namespace budget::tools {

inline constexpr std::size_t kDefaultSearchLimit = 50;
inline constexpr std::size_t kMaxSearchLimit = 500;
inline constexpr int kDefaultTrendMonths = 6;
inline constexpr int kMaxTrendMonths = 24;
inline constexpr std::size_t kOverviewTopCategories = 10;

// The five analysis tools. Each handler takes the raw tools/call arguments
// and returns a JSON object keyed by the analysis name.
class BudgetTools {
public:
    explicit BudgetTools(std::shared_ptr<const DataSource> source);

    core::errors::Result<nlohmann::json> analyze_category_spending(
        const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> get_budget_overview(
        const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> search_transactions(
        const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> analyze_spending_trends(
        const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> budget_health_check(
        const nlohmann::json& arguments) const;

private:
    core::errors::Result<std::shared_ptr<const BudgetSnapshot>> load(
        const std::string& budget_id) const;

    std::shared_ptr<const DataSource> source_;
};

// Registers the catalog in its advertised order.
core::errors::Result<std::size_t> register_budget_tools(ToolRegistry& registry,
                                                        std::shared_ptr<const BudgetTools> tools);

}  // namespace budget::tools
