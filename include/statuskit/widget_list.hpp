#ifndef STATUSKIT_WIDGET_LIST_HPP
#define STATUSKIT_WIDGET_LIST_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "statuskit/widget.hpp"

namespace statuskit {

    // name:accent:accent_icon:icon:type
    struct InternalEntry {
        std::string               name;
        std::string               accent;
        std::string               accent_icon;
        std::string               icon;
        std::optional<WidgetType> type;
    };

    // EXTERNAL|icon|content|accent|accent_icon|ttl[|name[|condition]]
    struct ExternalEntry {
        std::string icon;
        std::string content;
        std::string accent;
        std::string accent_icon;
        int64_t     ttl = 0;
        std::string name;
        std::string condition;
    };

    using WidgetEntry = std::variant<InternalEntry, ExternalEntry>;

    inline constexpr std::string_view kExternalPrefix = "EXTERNAL|";
    inline constexpr std::string_view kExternalName   = "external";

    std::optional<WidgetEntry> parse_widget_entry(std::string_view text);

    // Entries are separated by ';'. Empty and unparseable entries are
    // skipped.
    std::vector<WidgetEntry>   parse_widget_list(std::string_view text);

} // namespace statuskit

#endif // STATUSKIT_WIDGET_LIST_HPP
