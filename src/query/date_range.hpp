#pragma once
#include <string>

namespace budget::query {

    // Inclusive range of ISO YYYY-MM-DD dates, compared lexicographically.
    struct DateRange {
        std::string start;
        std::string end;

        bool contains(const std::string& date) const {
            return date >= start && date <= end;
        }
    };

} // namespace budget::query
