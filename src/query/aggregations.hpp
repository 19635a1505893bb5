#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/transaction.hpp"
#include "query/transaction_query.hpp"

namespace budget::query {

using Matches = std::vector<const domain::Transaction*>;

struct CashFlow {
    domain::Milliunits income = 0;
    domain::Milliunits expenses = 0;  // Positive magnitude
    domain::Milliunits net = 0;
    std::size_t transaction_count = 0;
};

struct CategorySpend {
    std::string category_id;
    domain::Milliunits spent = 0;  // Positive magnitude
};

struct HealthReport {
    CashFlow cash_flow;
    double savings_rate = 0.0;  // Percent of income kept
    std::vector<CategorySpend> overspending;
    int score = 0;              // 0..100
    std::string rating;
};

struct MonthBucket {
    std::string month;  // YYYY-MM
    domain::Milliunits income = 0;
    domain::Milliunits expenses = 0;
    domain::Milliunits net = 0;
    std::size_t transaction_count = 0;
};

enum class TrendDirection {
    Increasing,
    Decreasing,
    Stable
};

struct CategoryTrend {
    std::string category_id;
    domain::Milliunits total_spent = 0;
    domain::Milliunits average_monthly = 0;
    TrendDirection direction = TrendDirection::Stable;
};

// Absolute value of the summed amounts.
domain::Milliunits spend_total(const Matches& matches);
domain::Milliunits category_spend_total(const std::vector<domain::Transaction>& transactions,
                                        const std::string& category_id);

// Splits on the sign of amount; zero counts as non-expense.
CashFlow cash_flow(const Matches& matches);

// Outflow per category, ordered by category id. Inflows are ignored.
std::map<std::string, domain::Milliunits> spend_by_category(const Matches& matches);

// net / income * 100, or 0 when there is no income.
double savings_rate(const CashFlow& flow);

// Categories whose spend exceeds twice the mean per-category spend.
std::vector<CategorySpend> overspending_categories(
    const std::map<std::string, domain::Milliunits>& spend);

HealthReport health_check(const Matches& matches);
std::string health_rating(int score);

// `months` consecutive calendar months ending at `anchor_month` (YYYY-MM),
// oldest first. Without an anchor, the latest month present is used; with
// no dated transactions the result is empty.
std::vector<MonthBucket> monthly_buckets(const Matches& matches, int months,
                                         const std::optional<std::string>& anchor_month);

std::vector<CategoryTrend> category_trends(const Matches& matches,
                                           const std::vector<MonthBucket>& buckets);

TrendDirection trend_direction(domain::Milliunits first, domain::Milliunits last);
std::string to_string(TrendDirection direction);

std::optional<std::string> month_of(const std::string& date);
bool is_valid_month(const std::string& yyyy_mm);
std::string shift_month(const std::string& yyyy_mm, int delta);

}  // namespace budget::query
