#include "query/aggregations.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <system_error>
#include <unordered_map>

namespace budget::query {

using domain::Milliunits;
using domain::Transaction;

namespace {

constexpr Milliunits kMaxMilliunits = std::numeric_limits<Milliunits>::max();
constexpr Milliunits kMinMilliunits = std::numeric_limits<Milliunits>::min();

// Sums clamp at the int64 bounds instead of overflowing.
Milliunits saturating_add(const Milliunits a, const Milliunits b) {
    if (b > 0 && a > kMaxMilliunits - b) {
        return kMaxMilliunits;
    }
    if (b < 0 && a < kMinMilliunits - b) {
        return kMinMilliunits;
    }
    return a + b;
}

Milliunits magnitude(const Milliunits amount) {
    if (amount == kMinMilliunits) {
        return kMaxMilliunits;
    }
    return amount < 0 ? -amount : amount;
}

bool parse_month(const std::string& yyyy_mm, int& year, int& month) {
    if (yyyy_mm.size() != 7 || yyyy_mm[4] != '-') {
        return false;
    }
    const char* begin = yyyy_mm.data();
    auto [year_end, year_ec] = std::from_chars(begin, begin + 4, year);
    auto [month_end, month_ec] = std::from_chars(begin + 5, begin + 7, month);
    return year_ec == std::errc() && year_end == begin + 4 && month_ec == std::errc() &&
           month_end == begin + 7 && year >= 1 && month >= 1 && month <= 12;
}

}  // namespace

Milliunits spend_total(const Matches& matches) {
    Milliunits sum = 0;
    for (const Transaction* transaction : matches) {
        sum = saturating_add(sum, transaction->amount);
    }
    return magnitude(sum);
}

Milliunits category_spend_total(const std::vector<Transaction>& transactions,
                                const std::string& category_id) {
    return spend_total(TransactionQuery{}.with_category(category_id).apply(transactions));
}

CashFlow cash_flow(const Matches& matches) {
    CashFlow flow;
    for (const Transaction* transaction : matches) {
        if (transaction->is_expense()) {
            flow.expenses = saturating_add(flow.expenses, magnitude(transaction->amount));
        } else {
            flow.income = saturating_add(flow.income, transaction->amount);
        }
        ++flow.transaction_count;
    }
    // Both sides are non-negative, so the difference fits.
    flow.net = flow.income - flow.expenses;
    return flow;
}

std::map<std::string, Milliunits> spend_by_category(const Matches& matches) {
    std::map<std::string, Milliunits> spend;
    for (const Transaction* transaction : matches) {
        if (transaction->is_expense()) {
            Milliunits& spent = spend[transaction->category_id];
            spent = saturating_add(spent, magnitude(transaction->amount));
        }
    }
    return spend;
}

double savings_rate(const CashFlow& flow) {
    if (flow.income == 0) {
        return 0.0;
    }
    return static_cast<double>(flow.net) / static_cast<double>(flow.income) * 100.0;
}

std::vector<CategorySpend> overspending_categories(
    const std::map<std::string, Milliunits>& spend) {
    std::vector<CategorySpend> flagged;
    // Widened so neither the sum nor the products can overflow.
    long double total = 0.0L;
    long double counted = 0.0L;
    for (const auto& [category_id, spent] : spend) {
        if (spent > 0) {
            total += static_cast<long double>(spent);
            counted += 1.0L;
        }
    }
    if (counted == 0.0L) {
        return flagged;
    }

    // spent > 2 * (total / counted)
    for (const auto& [category_id, spent] : spend) {
        if (static_cast<long double>(spent) * counted > 2.0L * total) {
            flagged.push_back(CategorySpend{category_id, spent});
        }
    }
    std::stable_sort(flagged.begin(), flagged.end(),
                     [](const CategorySpend& a, const CategorySpend& b) {
                         return a.spent > b.spent;
                     });
    return flagged;
}

std::string health_rating(const int score) {
    if (score >= 80) return "excellent";
    if (score >= 60) return "good";
    if (score >= 40) return "fair";
    return "poor";
}

HealthReport health_check(const Matches& matches) {
    HealthReport report;
    report.cash_flow = cash_flow(matches);
    report.savings_rate = savings_rate(report.cash_flow);
    report.overspending = overspending_categories(spend_by_category(matches));

    double score = std::clamp(50.0 + report.savings_rate, 0.0, 100.0);
    score -= 10.0 * static_cast<double>(report.overspending.size());
    report.score = static_cast<int>(std::lround(std::clamp(score, 0.0, 100.0)));
    report.rating = health_rating(report.score);
    return report;
}

std::optional<std::string> month_of(const std::string& date) {
    if (date.size() < 7) {
        return std::nullopt;
    }
    std::string month = date.substr(0, 7);
    if (!is_valid_month(month)) {
        return std::nullopt;
    }
    return month;
}

bool is_valid_month(const std::string& yyyy_mm) {
    int year = 0;
    int month = 0;
    return parse_month(yyyy_mm, year, month);
}

std::string shift_month(const std::string& yyyy_mm, const int delta) {
    int year = 0;
    int month = 0;
    if (!parse_month(yyyy_mm, year, month)) {
        return yyyy_mm;
    }
    // Months before 0001-01 clamp to it.
    const int index = std::max(12, year * 12 + (month - 1) + delta);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d", index / 12, index % 12 + 1);
    return buffer;
}

std::vector<MonthBucket> monthly_buckets(const Matches& matches, const int months,
                                         const std::optional<std::string>& anchor_month) {
    std::vector<MonthBucket> buckets;
    if (months <= 0) {
        return buckets;
    }

    std::optional<std::string> anchor = anchor_month;
    if (!anchor.has_value()) {
        for (const Transaction* transaction : matches) {
            if (!transaction->date.has_value()) {
                continue;
            }
            auto month = month_of(transaction->date.value());
            if (month.has_value() && (!anchor.has_value() || month.value() > anchor.value())) {
                anchor = month;
            }
        }
    }
    if (!anchor.has_value() || !is_valid_month(anchor.value())) {
        return buckets;
    }

    std::unordered_map<std::string, std::size_t> index_by_month;
    for (int offset = months - 1; offset >= 0; --offset) {
        MonthBucket bucket;
        bucket.month = shift_month(anchor.value(), -offset);
        index_by_month.emplace(bucket.month, buckets.size());
        buckets.push_back(bucket);
    }

    for (const Transaction* transaction : matches) {
        if (!transaction->date.has_value()) {
            continue;
        }
        auto month = month_of(transaction->date.value());
        if (!month.has_value()) {
            continue;
        }
        auto it = index_by_month.find(month.value());
        if (it == index_by_month.end()) {
            continue;
        }
        MonthBucket& bucket = buckets[it->second];
        if (transaction->is_expense()) {
            bucket.expenses = saturating_add(bucket.expenses, magnitude(transaction->amount));
        } else {
            bucket.income = saturating_add(bucket.income, transaction->amount);
        }
        bucket.net = bucket.income - bucket.expenses;
        ++bucket.transaction_count;
    }
    return buckets;
}

TrendDirection trend_direction(const Milliunits first, const Milliunits last) {
    const long double scaled_last = static_cast<long double>(last) * 10.0L;
    if (scaled_last > static_cast<long double>(first) * 11.0L) {
        return TrendDirection::Increasing;
    }
    if (scaled_last < static_cast<long double>(first) * 9.0L) {
        return TrendDirection::Decreasing;
    }
    return TrendDirection::Stable;
}

std::string to_string(const TrendDirection direction) {
    switch (direction) {
        case TrendDirection::Increasing:
            return "increasing";
        case TrendDirection::Decreasing:
            return "decreasing";
        case TrendDirection::Stable:
            return "stable";
        default:
            return "unknown";
    }
}

std::vector<CategoryTrend> category_trends(const Matches& matches,
                                           const std::vector<MonthBucket>& buckets) {
    std::vector<CategoryTrend> trends;
    if (buckets.empty()) {
        return trends;
    }

    std::unordered_map<std::string, std::size_t> index_by_month;
    for (std::size_t i = 0; i < buckets.size(); ++i) {
        index_by_month.emplace(buckets[i].month, i);
    }

    // category -> outflow per bucket
    std::map<std::string, std::vector<Milliunits>> series;
    for (const Transaction* transaction : matches) {
        if (!transaction->is_expense() || !transaction->date.has_value()) {
            continue;
        }
        auto month = month_of(transaction->date.value());
        if (!month.has_value()) {
            continue;
        }
        auto it = index_by_month.find(month.value());
        if (it == index_by_month.end()) {
            continue;
        }
        auto& values = series[transaction->category_id];
        values.resize(buckets.size(), 0);
        values[it->second] = saturating_add(values[it->second], magnitude(transaction->amount));
    }

    const auto month_count = static_cast<Milliunits>(buckets.size());
    for (const auto& [category_id, values] : series) {
        CategoryTrend trend;
        trend.category_id = category_id;
        for (const Milliunits value : values) {
            trend.total_spent = saturating_add(trend.total_spent, value);
        }
        trend.average_monthly = trend.total_spent / month_count;
        trend.direction = trend_direction(values.front(), values.back());
        trends.push_back(trend);
    }
    std::stable_sort(trends.begin(), trends.end(),
                     [](const CategoryTrend& a, const CategoryTrend& b) {
                         return a.total_spent > b.total_spent;
                     });
    return trends;
}

}  // namespace budget::query
