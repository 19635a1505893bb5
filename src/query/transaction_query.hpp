#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/transaction.hpp"
#include "query/date_range.hpp"

namespace budget::query {

enum class SortMode {
    AmountAscending,
    AmountDescending,
    Date
};

// Immutable filter and sort specification. Every with_* call returns a new
// query and leaves the receiver untouched.
class TransactionQuery {
public:
    TransactionQuery with_min_amount(domain::Milliunits min) const;
    TransactionQuery with_max_amount(domain::Milliunits max) const;
    TransactionQuery with_amount_range(domain::Milliunits min, domain::Milliunits max) const;

    // An empty list means "no category filter", not "match nothing".
    TransactionQuery with_categories(std::vector<std::string> category_ids) const;
    TransactionQuery with_category(std::string category_id) const;

    TransactionQuery with_text_search(std::string text) const;
    TransactionQuery with_date_range(DateRange range) const;
    TransactionQuery with_sort(SortMode mode) const;

    // Matching transactions in result order. Pointers refer into `transactions`.
    std::vector<const domain::Transaction*> apply(
        const std::vector<domain::Transaction>& transactions) const;

    bool matches(const domain::Transaction& transaction) const;

    const std::optional<domain::Milliunits>& min_amount() const { return min_amount_; }
    const std::optional<domain::Milliunits>& max_amount() const { return max_amount_; }
    const std::vector<std::string>& categories() const { return categories_; }
    const std::optional<std::string>& search_text() const { return search_text_; }
    const std::optional<DateRange>& date_range() const { return date_range_; }
    const std::optional<SortMode>& sort_mode() const { return sort_mode_; }

private:
    bool matches_amount(const domain::Transaction& transaction) const;
    bool matches_category(const domain::Transaction& transaction) const;
    bool matches_text(const domain::Transaction& transaction) const;
    bool matches_date(const domain::Transaction& transaction) const;

    std::optional<domain::Milliunits> min_amount_;
    std::optional<domain::Milliunits> max_amount_;
    std::vector<std::string> categories_;
    std::optional<std::string> search_text_;  // Stored lower-cased
    std::optional<DateRange> date_range_;
    std::optional<SortMode> sort_mode_;
};

std::string to_lower_ascii(std::string value);

}  // namespace budget::query
