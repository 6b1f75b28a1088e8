#include "statuskit/widget_list.hpp"

#include "statuskit/logging.hpp"
#include "statuskit/strings.hpp"

namespace statuskit {

    namespace {

        std::string field(const std::vector<std::string>& parts, size_t index) {
            return index < parts.size() ? parts[index] : std::string{};
        }

        std::optional<WidgetEntry> parse_external(std::string_view text) {
            const auto parts = split(text, '|');
            ExternalEntry entry;
            entry.icon        = field(parts, 1);
            entry.content     = field(parts, 2);
            entry.accent      = trim_copy(field(parts, 3));
            entry.accent_icon = trim_copy(field(parts, 4));
            entry.ttl         = parse_int(trim_view(field(parts, 5))).value_or(0);
            entry.name        = trim_copy(field(parts, 6));
            entry.condition   = field(parts, 7);
            if (entry.content.empty()) {
                return std::nullopt;
            }
            if (entry.name.empty()) {
                entry.name = std::string(kExternalName);
            }
            return entry;
        }

        std::optional<WidgetEntry> parse_internal(std::string_view text) {
            const auto    parts = split(text, ':');
            InternalEntry entry;
            entry.name        = trim_copy(field(parts, 0));
            entry.accent      = trim_copy(field(parts, 1));
            entry.accent_icon = trim_copy(field(parts, 2));
            entry.icon        = field(parts, 3);
            if (const auto type = field(parts, 4); !trim_view(type).empty()) {
                entry.type = parse_widget_type(type);
                if (!entry.type) {
                    debug_log("widgets", "unknown widget type '" + type + "' for " + entry.name);
                }
            }
            if (entry.name.empty()) {
                return std::nullopt;
            }
            return entry;
        }

    } // namespace

    std::optional<WidgetEntry> parse_widget_entry(std::string_view text) {
        text = trim_view(text);
        if (text.empty()) {
            return std::nullopt;
        }
        if (text.starts_with(kExternalPrefix)) {
            return parse_external(text);
        }
        return parse_internal(text);
    }

    std::vector<WidgetEntry> parse_widget_list(std::string_view text) {
        std::vector<WidgetEntry> entries;
        for (const auto& part : split(text, ';')) {
            if (auto entry = parse_widget_entry(part)) {
                entries.push_back(std::move(*entry));
            }
        }
        return entries;
    }

} // namespace statuskit
