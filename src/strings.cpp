#include "statuskit/strings.hpp"

#include <cctype>
#include <charconv>

namespace statuskit {

    std::string_view trim_view(std::string_view value) {
        size_t start = 0;
        while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
            ++start;
        }
        size_t end = value.size();
        while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
            --end;
        }
        return value.substr(start, end - start);
    }

    std::string trim_copy(std::string_view value) {
        return std::string(trim_view(value));
    }

    std::string to_lower_copy(std::string_view value) {
        std::string output;
        output.reserve(value.size());
        for (const char ch : value) {
            output.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        return output;
    }

    std::vector<std::string> split(std::string_view value, char delimiter) {
        std::vector<std::string> parts;
        size_t                   start = 0;
        while (true) {
            const auto pos = value.find(delimiter, start);
            if (pos == std::string_view::npos) {
                parts.emplace_back(value.substr(start));
                break;
            }
            parts.emplace_back(value.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    bool is_integer(std::string_view value) {
        if (value.empty()) {
            return false;
        }
        size_t index = value.front() == '-' ? 1 : 0;
        if (index == value.size()) {
            return false;
        }
        for (; index < value.size(); ++index) {
            if (std::isdigit(static_cast<unsigned char>(value[index])) == 0) {
                return false;
            }
        }
        return true;
    }

    std::optional<int64_t> parse_int(std::string_view value) {
        if (!is_integer(value)) {
            return std::nullopt;
        }
        int64_t    parsed = 0;
        const auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (result.ec != std::errc{} || result.ptr != value.data() + value.size()) {
            return std::nullopt;
        }
        return parsed;
    }

    std::optional<int64_t> extract_first_number(std::string_view value) {
        size_t start = 0;
        while (start < value.size() && std::isdigit(static_cast<unsigned char>(value[start])) == 0) {
            ++start;
        }
        if (start == value.size()) {
            return std::nullopt;
        }
        size_t end = start;
        while (end < value.size() && std::isdigit(static_cast<unsigned char>(value[end])) != 0) {
            ++end;
        }
        return parse_int(value.substr(start, end - start));
    }

    uint32_t fnv1a_hash(std::string_view value) {
        uint32_t hash = 2166136261u;
        for (const char ch : value) {
            hash ^= static_cast<unsigned char>(ch);
            hash *= 16777619u;
        }
        return hash;
    }

}
