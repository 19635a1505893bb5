#include "provider/response_mapper.hpp"

#include <optional>
#include <string>

namespace budget::provider {

using core::errors::BudgetError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool bool_field(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

const json* find_path(const json& root, const char* outer, const char* inner) {
    if (!root.is_object()) {
        return nullptr;
    }
    auto outer_it = root.find(outer);
    if (outer_it == root.end() || !outer_it->is_object()) {
        return nullptr;
    }
    auto inner_it = outer_it->find(inner);
    if (inner_it == outer_it->end()) {
        return nullptr;
    }
    return &*inner_it;
}

}  // namespace

domain::Budget ResponseMapper::map_budget(const json& payload) const {
    if (!payload.is_object()) {
        return domain::Budget{};
    }
    return domain::Budget{string_field(payload, "id"), string_field(payload, "name")};
}

domain::Category ResponseMapper::map_category(const json& payload) const {
    domain::Category category;
    if (!payload.is_object()) {
        return category;
    }
    category.id = string_field(payload, "id");
    category.name = string_field(payload, "name");
    category.group_id = optional_string_field(payload, "category_group_id");
    category.hidden = bool_field(payload, "hidden");
    return category;
}

domain::Transaction ResponseMapper::map_transaction(const json& payload) const {
    domain::Transaction transaction;
    if (!payload.is_object()) {
        return transaction;
    }
    transaction.id = string_field(payload, "id");
    transaction.account_id = string_field(payload, "account_id");
    transaction.category_id = string_field(payload, "category_id");
    transaction.payee_id = optional_string_field(payload, "payee_id");
    auto amount_it = payload.find("amount");
    if (amount_it != payload.end() && amount_it->is_number_integer()) {
        transaction.amount = amount_it->get<domain::Milliunits>();
    }
    transaction.date = optional_string_field(payload, "date");
    transaction.description = optional_string_field(payload, "memo");
    return transaction;
}

core::errors::Result<domain::Budget> ResponseMapper::map_budget_from_response(
    const json& payload) const {
    if (const auto* budget = find_path(payload, "data", "budget")) {
        return map_budget(*budget);
    }
    if (payload.is_object() && payload.contains("id")) {
        return map_budget(payload);
    }
    return BudgetError{ErrorCategory::Provider, "Invalid budget response format",
                       "invalid_response_format"};
}

core::errors::Result<std::vector<domain::Category>>
ResponseMapper::map_categories_from_response(const json& payload) const {
    std::vector<domain::Category> categories;

    if (const auto* groups = find_path(payload, "data", "category_groups")) {
        if (!groups->is_array()) {
            return BudgetError{ErrorCategory::Provider, "Invalid categories response format",
                               "invalid_response_format"};
        }
        for (const auto& group : *groups) {
            if (!group.is_object() || bool_field(group, "deleted")) {
                continue;
            }
            auto list = group.find("categories");
            if (list == group.end() || !list->is_array()) {
                continue;
            }
            for (const auto& entry : *list) {
                if (!bool_field(entry, "deleted")) {
                    categories.push_back(map_category(entry));
                }
            }
        }
        return categories;
    }

    const auto* flat = find_path(payload, "data", "categories");
    if (flat == nullptr && payload.is_array()) {
        flat = &payload;
    }
    if (flat == nullptr || !flat->is_array()) {
        return BudgetError{ErrorCategory::Provider, "Invalid categories response format",
                           "invalid_response_format"};
    }
    for (const auto& entry : *flat) {
        if (!bool_field(entry, "deleted")) {
            categories.push_back(map_category(entry));
        }
    }
    return categories;
}

core::errors::Result<std::vector<domain::Transaction>>
ResponseMapper::map_transactions_from_response(const json& payload) const {
    const auto* list = find_path(payload, "data", "transactions");
    if (list == nullptr && payload.is_array()) {
        list = &payload;
    }
    if (list == nullptr || !list->is_array()) {
        return BudgetError{ErrorCategory::Provider, "Invalid transactions response format",
                           "invalid_response_format"};
    }

    std::vector<domain::Transaction> transactions;
    transactions.reserve(list->size());
    for (const auto& entry : *list) {
        if (bool_field(entry, "deleted")) {
            continue;
        }
        transactions.push_back(map_transaction(entry));
    }
    return transactions;
}

}  // namespace budget::provider
