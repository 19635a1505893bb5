#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/budget_errors.hpp"
#include "domain/category.hpp"
#include "domain/transaction.hpp"

namespace budget::provider {

// Maps upstream JSON payloads onto domain records. Missing scalar fields
// become empty strings or zero; a payload without the expected collection
// is a Provider error.
class ResponseMapper {
public:
    domain::Budget map_budget(const nlohmann::json& payload) const;
    domain::Category map_category(const nlohmann::json& payload) const;
    domain::Transaction map_transaction(const nlohmann::json& payload) const;

    // Accepts {"data":{"budget":{...}}} or a bare budget object.
    core::errors::Result<domain::Budget> map_budget_from_response(
        const nlohmann::json& payload) const;

    // Accepts {"data":{"category_groups":[{"categories":[...]}]}},
    // {"data":{"categories":[...]}} or a bare array.
    core::errors::Result<std::vector<domain::Category>> map_categories_from_response(
        const nlohmann::json& payload) const;

    // Accepts {"data":{"transactions":[...]}} or a bare array. Entries
    // flagged "deleted" are skipped.
    core::errors::Result<std::vector<domain::Transaction>> map_transactions_from_response(
        const nlohmann::json& payload) const;
};

}  // namespace budget::provider
