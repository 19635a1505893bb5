#include "tools/budget_tools.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "query/aggregations.hpp"
#include "query/transaction_query.hpp"

namespace budget::tools {

using core::errors::BudgetError;
using core::errors::ErrorCategory;
using domain::Milliunits;
using domain::Transaction;
using nlohmann::json;

namespace {

// Absent, null or non-string values read as "".
std::string string_arg(const json& arguments, const char* key) {
    if (!arguments.is_object()) {
        return "";
    }
    auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string_arg(const json& arguments, const char* key) {
    std::string value = string_arg(arguments, key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> integer_arg(const json& arguments, const char* key) {
    if (!arguments.is_object()) {
        return std::nullopt;
    }
    auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

std::vector<std::string> string_list_arg(const json& arguments, const char* key) {
    std::vector<std::string> values;
    if (!arguments.is_object()) {
        return values;
    }
    auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_array()) {
        return values;
    }
    for (const auto& item : *it) {
        if (item.is_string() && !item.get<std::string>().empty()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

// since_date/until_date into an inclusive range; either side may be open.
// A reversed range is malformed and leaves the dates unfiltered.
std::optional<query::DateRange> date_range_arg(const json& arguments) {
    auto since = optional_string_arg(arguments, "since_date");
    auto until = optional_string_arg(arguments, "until_date");
    if (!since.has_value() && !until.has_value()) {
        return std::nullopt;
    }

    query::DateRange range{since.value_or("0000-01-01"), until.value_or("9999-12-31")};
    if (range.start > range.end) {
        LOG_DEBUG("BudgetTools: ignoring reversed date range " + range.start + ".." + range.end);
        return std::nullopt;
    }
    return range;
}

std::optional<query::SortMode> sort_arg(const json& arguments) {
    const std::string sort = string_arg(arguments, "sort");
    if (sort == "amount_asc") return query::SortMode::AmountAscending;
    if (sort == "amount_desc") return query::SortMode::AmountDescending;
    if (sort == "date") return query::SortMode::Date;
    return std::nullopt;
}

json transaction_to_json(const Transaction& transaction, const BudgetSnapshot& snapshot) {
    json item = {
        {"id", transaction.id},
        {"account_id", transaction.account_id},
        {"category_id", transaction.category_id},
        {"category_name", snapshot.category_name(transaction.category_id)},
        {"amount", transaction.amount},
    };
    if (transaction.payee_id.has_value()) {
        item["payee_id"] = transaction.payee_id.value();
    }
    if (transaction.date.has_value()) {
        item["date"] = transaction.date.value();
    }
    if (transaction.description.has_value()) {
        item["description"] = transaction.description.value();
    }
    return item;
}

json category_spend_to_json(const query::CategorySpend& spend, const BudgetSnapshot& snapshot) {
    return json{{"category_id", spend.category_id},
                {"category_name", snapshot.category_name(spend.category_id)},
                {"spent", spend.spent}};
}

std::vector<std::string> recommendations_for(const query::HealthReport& report,
                                             const BudgetSnapshot& snapshot) {
    std::vector<std::string> advice;
    if (report.cash_flow.income == 0 && report.cash_flow.expenses > 0) {
        advice.push_back("No income recorded for this period; verify that inflows are categorized.");
    } else if (report.savings_rate < 0.0) {
        advice.push_back("Spending exceeds income; reduce expenses to stop drawing down savings.");
    } else if (report.savings_rate < 10.0) {
        advice.push_back("Savings rate is below 10%; look for recurring costs to cut.");
    }
    for (const auto& spend : report.overspending) {
        advice.push_back("Review spending in " + snapshot.category_name(spend.category_id) +
                         "; it is more than twice the average category.");
    }
    if (advice.empty()) {
        advice.push_back("Spending is balanced; keep the current plan.");
    }
    return advice;
}

}  // namespace

BudgetTools::BudgetTools(std::shared_ptr<const DataSource> source) : source_(std::move(source)) {}

core::errors::Result<std::shared_ptr<const BudgetSnapshot>> BudgetTools::load(
    const std::string& budget_id) const {
    if (!source_) {
        return BudgetError{ErrorCategory::Internal, "No data source configured",
                           "missing_data_source"};
    }
    auto snapshot = source_->load(budget_id);
    if (core::errors::is_error(snapshot)) {
        LOG_WARN("BudgetTools: load failed for budget '" + budget_id +
                 "': " + core::errors::get_error(snapshot).message);
        return snapshot;
    }
    if (!core::errors::get_value(snapshot)) {
        return BudgetError{ErrorCategory::Internal, "Data source returned no snapshot",
                           "missing_snapshot"};
    }
    return snapshot;
}

core::errors::Result<json> BudgetTools::analyze_category_spending(const json& arguments) const {
    const std::string budget_id = string_arg(arguments, "budget_id");
    auto loaded = load(budget_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const BudgetSnapshot& snapshot = *core::errors::get_value(loaded);

    const auto range = date_range_arg(arguments);

    std::string category_id = string_arg(arguments, "category_id");
    if (category_id.empty()) {
        const std::string category_name = string_arg(arguments, "category_name");
        category_id = snapshot.find_category_id(category_name).value_or(category_name);
    }

    query::TransactionQuery filter;
    if (!category_id.empty()) {
        filter = filter.with_category(category_id);
    }
    if (range.has_value()) {
        filter = filter.with_date_range(range.value());
    }
    const query::Matches matches = filter.apply(snapshot.transactions);
    const Milliunits total = query::spend_total(matches);

    json result = {
        {"budget_id", budget_id},
        {"category_id", category_id},
        {"category_name", category_id.empty() ? "" : snapshot.category_name(category_id)},
        {"total_spent", total},
        {"transaction_count", matches.size()},
        {"average_transaction",
         matches.empty() ? 0 : total / static_cast<Milliunits>(matches.size())},
    };
    if (auto since = optional_string_arg(arguments, "since_date")) {
        result["since_date"] = since.value();
    }
    if (auto until = optional_string_arg(arguments, "until_date")) {
        result["until_date"] = until.value();
    }
    return json{{"category_spending", result}};
}

core::errors::Result<json> BudgetTools::get_budget_overview(const json& arguments) const {
    const std::string budget_id = string_arg(arguments, "budget_id");
    auto loaded = load(budget_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const BudgetSnapshot& snapshot = *core::errors::get_value(loaded);

    const query::Matches all = query::TransactionQuery{}.apply(snapshot.transactions);
    const query::CashFlow flow = query::cash_flow(all);

    std::vector<query::CategorySpend> ranked;
    for (const auto& [category_id, spent] : query::spend_by_category(all)) {
        ranked.push_back(query::CategorySpend{category_id, spent});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const query::CategorySpend& a, const query::CategorySpend& b) {
                         return a.spent > b.spent;
                     });
    if (ranked.size() > kOverviewTopCategories) {
        ranked.resize(kOverviewTopCategories);
    }

    json top = json::array();
    for (const auto& spend : ranked) {
        top.push_back(category_spend_to_json(spend, snapshot));
    }

    return json{{"budget_overview",
                 {{"budget_id", budget_id},
                  {"budget_name", snapshot.budget.name},
                  {"total_income", flow.income},
                  {"total_expenses", flow.expenses},
                  {"net", flow.net},
                  {"transaction_count", flow.transaction_count},
                  {"category_count", snapshot.categories.size()},
                  {"top_categories", top}}}};
}

core::errors::Result<json> BudgetTools::search_transactions(const json& arguments) const {
    const std::string budget_id = string_arg(arguments, "budget_id");
    auto loaded = load(budget_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const BudgetSnapshot& snapshot = *core::errors::get_value(loaded);

    const auto range = date_range_arg(arguments);

    query::TransactionQuery filter;
    if (auto min = integer_arg(arguments, "min_amount")) {
        filter = filter.with_min_amount(min.value());
    }
    if (auto max = integer_arg(arguments, "max_amount")) {
        filter = filter.with_max_amount(max.value());
    }

    std::vector<std::string> categories = string_list_arg(arguments, "category_ids");
    if (auto category_id = optional_string_arg(arguments, "category_id")) {
        categories.push_back(category_id.value());
    }
    filter = filter.with_categories(std::move(categories));

    if (auto text = optional_string_arg(arguments, "query")) {
        filter = filter.with_text_search(text.value());
    }
    if (range.has_value()) {
        filter = filter.with_date_range(range.value());
    }
    if (auto sort = sort_arg(arguments)) {
        filter = filter.with_sort(sort.value());
    }

    std::size_t limit = kDefaultSearchLimit;
    if (auto requested = integer_arg(arguments, "limit"); requested.has_value() && requested.value() > 0) {
        limit = std::min(static_cast<std::size_t>(requested.value()), kMaxSearchLimit);
    }

    const query::Matches matches = filter.apply(snapshot.transactions);
    json items = json::array();
    for (std::size_t i = 0; i < matches.size() && i < limit; ++i) {
        items.push_back(transaction_to_json(*matches[i], snapshot));
    }

    return json{{"transactions",
                 {{"budget_id", budget_id},
                  {"total_matches", matches.size()},
                  {"returned", items.size()},
                  {"items", items}}}};
}

core::errors::Result<json> BudgetTools::analyze_spending_trends(const json& arguments) const {
    const std::string budget_id = string_arg(arguments, "budget_id");
    auto loaded = load(budget_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const BudgetSnapshot& snapshot = *core::errors::get_value(loaded);

    int months = kDefaultTrendMonths;
    if (auto requested = integer_arg(arguments, "months")) {
        months = static_cast<int>(
            std::clamp<std::int64_t>(requested.value(), 1, kMaxTrendMonths));
    }

    std::optional<std::string> anchor = optional_string_arg(arguments, "as_of_month");
    if (anchor.has_value() && !query::is_valid_month(anchor.value())) {
        LOG_DEBUG("BudgetTools: ignoring malformed as_of_month " + anchor.value());
        anchor.reset();
    }

    query::TransactionQuery filter;
    if (auto category_id = optional_string_arg(arguments, "category_id")) {
        filter = filter.with_category(category_id.value());
    }
    const query::Matches matches = filter.apply(snapshot.transactions);
    const auto buckets = query::monthly_buckets(matches, months, anchor);

    json monthly = json::array();
    for (const auto& bucket : buckets) {
        monthly.push_back({{"month", bucket.month},
                           {"income", bucket.income},
                           {"expenses", bucket.expenses},
                           {"net", bucket.net},
                           {"transaction_count", bucket.transaction_count}});
    }

    json trends = json::array();
    for (const auto& trend : query::category_trends(matches, buckets)) {
        trends.push_back({{"category_id", trend.category_id},
                          {"category_name", snapshot.category_name(trend.category_id)},
                          {"total_spent", trend.total_spent},
                          {"average_monthly", trend.average_monthly},
                          {"direction", query::to_string(trend.direction)}});
    }

    const query::TrendDirection overall =
        buckets.empty() ? query::TrendDirection::Stable
                        : query::trend_direction(buckets.front().expenses, buckets.back().expenses);

    return json{{"spending_trends",
                 {{"budget_id", budget_id},
                  {"months_analyzed", buckets.size()},
                  {"anchor_month", buckets.empty() ? json(nullptr) : json(buckets.back().month)},
                  {"monthly", monthly},
                  {"category_trends", trends},
                  {"overall_direction", query::to_string(overall)}}}};
}

core::errors::Result<json> BudgetTools::budget_health_check(const json& arguments) const {
    const std::string budget_id = string_arg(arguments, "budget_id");
    auto loaded = load(budget_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const BudgetSnapshot& snapshot = *core::errors::get_value(loaded);

    const query::HealthReport report =
        query::health_check(query::TransactionQuery{}.apply(snapshot.transactions));

    json overspending = json::array();
    for (const auto& spend : report.overspending) {
        overspending.push_back(category_spend_to_json(spend, snapshot));
    }

    // Two decimals are enough for a percentage shown to a person.
    const double rounded_rate = std::round(report.savings_rate * 100.0) / 100.0;

    return json{{"budget_health",
                 {{"budget_id", budget_id},
                  {"score", report.score},
                  {"rating", report.rating},
                  {"savings_rate", rounded_rate},
                  {"total_income", report.cash_flow.income},
                  {"total_expenses", report.cash_flow.expenses},
                  {"net", report.cash_flow.net},
                  {"overspending_categories", overspending},
                  {"recommendations", recommendations_for(report, snapshot)}}}};
}

core::errors::Result<std::size_t> register_budget_tools(ToolRegistry& registry,
                                                        std::shared_ptr<const BudgetTools> tools) {
    if (!tools) {
        return BudgetError{ErrorCategory::Internal, "No tool set to register", "missing_tools"};
    }

    struct Binding {
        const char* name;
        const char* description;
        core::errors::Result<json> (BudgetTools::*handler)(const json&) const;
    };
    const Binding bindings[] = {
        {"analyze_category_spending",
         "Total spend, transaction count and average for one category, optionally within "
         "since_date/until_date.",
         &BudgetTools::analyze_category_spending},
        {"get_budget_overview",
         "Income, expenses, net and the top spending categories for a budget.",
         &BudgetTools::get_budget_overview},
        {"search_transactions",
         "Filter transactions by text, amount range, categories and dates, with optional sort "
         "and limit.",
         &BudgetTools::search_transactions},
        {"analyze_spending_trends",
         "Month-by-month income and expenses with per-category trend direction.",
         &BudgetTools::analyze_spending_trends},
        {"budget_health_check",
         "Savings rate, overspending categories and a 0-100 health score with recommendations.",
         &BudgetTools::budget_health_check},
    };

    std::size_t count = registry.size();
    for (const auto& binding : bindings) {
        auto handler = binding.handler;
        auto registered = registry.register_tool(
            binding.name, binding.description,
            [tools, handler](const json& arguments) { return ((*tools).*handler)(arguments); });
        if (core::errors::is_error(registered)) {
            return core::errors::get_error(registered);
        }
        count = core::errors::get_value(registered);
    }
    return count;
}

}  // namespace budget::tools
