#pragma once
#include <optional>
#include <string>

namespace budget::domain {

    struct Category {
        std::string id;
        std::string name;
        std::optional<std::string> group_id;
        bool hidden = false;
    };

    struct Budget {
        std::string id;
        std::string name;
    };

} // namespace budget::domain
