#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace budget::domain {

    // 1/1000 of the major currency unit. Negative = outflow, positive = inflow.
    using Milliunits = std::int64_t;

    struct Transaction {
        std::string id;
        std::string account_id;
        std::string category_id;
        std::optional<std::string> payee_id;
        Milliunits amount = 0;
        std::optional<std::string> date;         // ISO YYYY-MM-DD
        std::optional<std::string> description;  // Upstream "memo"

        bool is_expense() const { return amount < 0; }
    };

} // namespace budget::domain
