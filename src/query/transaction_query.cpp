#include "query/transaction_query.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace budget::query {

using domain::Milliunits;
using domain::Transaction;

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

TransactionQuery TransactionQuery::with_min_amount(const Milliunits min) const {
    TransactionQuery next = *this;
    next.min_amount_ = min;
    return next;
}

TransactionQuery TransactionQuery::with_max_amount(const Milliunits max) const {
    TransactionQuery next = *this;
    next.max_amount_ = max;
    return next;
}

TransactionQuery TransactionQuery::with_amount_range(const Milliunits min,
                                                     const Milliunits max) const {
    return with_min_amount(min).with_max_amount(max);
}

TransactionQuery TransactionQuery::with_categories(std::vector<std::string> category_ids) const {
    TransactionQuery next = *this;
    next.categories_ = std::move(category_ids);
    return next;
}

TransactionQuery TransactionQuery::with_category(std::string category_id) const {
    return with_categories({std::move(category_id)});
}

TransactionQuery TransactionQuery::with_text_search(std::string text) const {
    TransactionQuery next = *this;
    next.search_text_ = to_lower_ascii(std::move(text));
    return next;
}

TransactionQuery TransactionQuery::with_date_range(DateRange range) const {
    TransactionQuery next = *this;
    next.date_range_ = std::move(range);
    return next;
}

TransactionQuery TransactionQuery::with_sort(const SortMode mode) const {
    TransactionQuery next = *this;
    next.sort_mode_ = mode;
    return next;
}

bool TransactionQuery::matches_amount(const Transaction& transaction) const {
    if (min_amount_.has_value() && transaction.amount < min_amount_.value()) {
        return false;
    }
    if (max_amount_.has_value() && transaction.amount > max_amount_.value()) {
        return false;
    }
    return true;
}

bool TransactionQuery::matches_category(const Transaction& transaction) const {
    if (categories_.empty()) {
        return true;
    }
    return std::find(categories_.begin(), categories_.end(), transaction.category_id) !=
           categories_.end();
}

bool TransactionQuery::matches_text(const Transaction& transaction) const {
    if (!search_text_.has_value()) {
        return true;
    }
    if (!transaction.description.has_value()) {
        return false;
    }
    return to_lower_ascii(transaction.description.value()).find(search_text_.value()) !=
           std::string::npos;
}

bool TransactionQuery::matches_date(const Transaction& transaction) const {
    if (!date_range_.has_value()) {
        return true;
    }
    return transaction.date.has_value() && date_range_->contains(transaction.date.value());
}

bool TransactionQuery::matches(const Transaction& transaction) const {
    return matches_amount(transaction) && matches_category(transaction) &&
           matches_text(transaction) && matches_date(transaction);
}

std::vector<const Transaction*> TransactionQuery::apply(
    const std::vector<Transaction>& transactions) const {
    std::vector<const Transaction*> filtered;
    filtered.reserve(transactions.size());
    for (const auto& transaction : transactions) {
        if (matches(transaction)) {
            filtered.push_back(&transaction);
        }
    }

    if (!sort_mode_.has_value()) {
        return filtered;
    }

    switch (sort_mode_.value()) {
        case SortMode::AmountAscending:
            std::stable_sort(filtered.begin(), filtered.end(),
                             [](const Transaction* a, const Transaction* b) {
                                 return a->amount < b->amount;
                             });
            break;
        case SortMode::AmountDescending:
            std::stable_sort(filtered.begin(), filtered.end(),
                             [](const Transaction* a, const Transaction* b) {
                                 return a->amount > b->amount;
                             });
            break;
        case SortMode::Date:
            // Dated before dateless; two dateless entries are equal-ranked.
            std::stable_sort(filtered.begin(), filtered.end(),
                             [](const Transaction* a, const Transaction* b) {
                                 if (a->date.has_value() && b->date.has_value()) {
                                     return a->date.value() < b->date.value();
                                 }
                                 return a->date.has_value() && !b->date.has_value();
                             });
            break;
    }
    return filtered;
}

}  // namespace budget::query
