#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace statuskit {

    std::string_view         trim_view(std::string_view value);
    std::string              trim_copy(std::string_view value);
    std::string              to_lower_copy(std::string_view value);
    std::vector<std::string> split(std::string_view value, char delimiter);

    bool                     is_integer(std::string_view value);
    std::optional<int64_t>   parse_int(std::string_view value);
    std::optional<int64_t>   extract_first_number(std::string_view value);

    uint32_t                 fnv1a_hash(std::string_view value);

}
