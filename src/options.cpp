#include "statuskit/options.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "statuskit/config.hpp"
#include "statuskit/strings.hpp"

namespace statuskit {

    namespace {

        std::string memo_key(std::string_view widget, std::string_view name) {
            std::string key;
            key.reserve(widget.size() + name.size() + 1);
            key.append(widget);
            key.push_back('\0');
            key.append(name);
            return key;
        }

        std::string fallback_key(std::string_view widget, std::string_view name) {
            std::string key(widget);
            key.push_back('.');
            key.append(name);
            return key;
        }

        const OptionDescriptor* find_standard(std::string_view name) {
            const auto& options = standard_options();
            const auto  it      = std::find_if(options.begin(), options.end(), [&](const OptionDescriptor& option) { return option.name == name; });
            return it == options.end() ? nullptr : &*it;
        }

        std::string validate(OptionKind kind, std::string value, const std::string& default_value) {
            switch (kind) {
                case OptionKind::kNumber: {
                    if (is_integer(value)) {
                        return value;
                    }
                    return default_value;
                }
                case OptionKind::kBool: {
                    if (const auto parsed = parse_bool_word(value)) {
                        return *parsed ? "true" : "false";
                    }
                    if (const auto parsed = parse_bool_word(default_value)) {
                        return *parsed ? "true" : "false";
                    }
                    return default_value;
                }
                case OptionKind::kString:
                case OptionKind::kColor:
                case OptionKind::kIcon:
                case OptionKind::kKey:
                case OptionKind::kPath: return value;
            }
            return value;
        }

    } // namespace

    std::string_view option_kind_name(OptionKind kind) {
        switch (kind) {
            case OptionKind::kString: return "string";
            case OptionKind::kNumber: return "number";
            case OptionKind::kBool: return "bool";
            case OptionKind::kColor: return "color";
            case OptionKind::kIcon: return "icon";
            case OptionKind::kKey: return "key";
            case OptionKind::kPath: return "path";
        }
        return "string";
    }

    std::optional<OptionKind> parse_option_kind(std::string_view value) {
        const auto normalized = to_lower_copy(trim_view(value));
        for (const auto kind : {OptionKind::kString, OptionKind::kNumber, OptionKind::kBool, OptionKind::kColor, OptionKind::kIcon, OptionKind::kKey, OptionKind::kPath}) {
            if (normalized == option_kind_name(kind)) {
                return kind;
            }
        }
        return std::nullopt;
    }

    std::string host_option_name(std::string_view widget, std::string_view name) {
        std::string option(kHostOptionPrefix);
        option.append(widget);
        option.push_back('_');
        option.append(name);
        return option;
    }

    FallbackDefaults FallbackDefaults::builtin() {
        FallbackDefaults defaults;
        defaults.set(kAnyWidget, "accent_color", "secondary");
        defaults.set(kAnyWidget, "accent_color_icon", "active");
        defaults.set(kAnyWidget, "cache_ttl", "0");
        return defaults;
    }

    void FallbackDefaults::set(std::string_view widget, std::string_view name, std::string value) {
        values_[fallback_key(widget, name)] = std::move(value);
    }

    std::optional<std::string> FallbackDefaults::get(std::string_view widget, std::string_view name) const {
        if (const auto it = values_.find(fallback_key(widget, name)); it != values_.end()) {
            return it->second;
        }
        if (const auto it = values_.find(fallback_key(kAnyWidget, name)); it != values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    const std::vector<OptionDescriptor>& standard_options() {
        static const std::vector<OptionDescriptor> options = {
            {"display_condition", OptionKind::kString, "always", "Show the widget only when its severity compares with display_threshold (always, eq, lt, lte, gt, gte)"},
            {"display_threshold", OptionKind::kString, "", "Severity used by display_condition (inactive, normal, info, warning, error)"},
        };
        return options;
    }

    OptionRegistry::OptionRegistry(const OptionSource& host, FallbackDefaults fallbacks) : host_(host), fallbacks_(std::move(fallbacks)) {}

    void OptionRegistry::declare_option(std::string_view widget, OptionDescriptor descriptor) {
        auto& options = declarations_[std::string(widget)];
        auto  it      = std::find_if(options.begin(), options.end(), [&](const OptionDescriptor& option) { return option.name == descriptor.name; });
        if (it != options.end()) {
            *it = std::move(descriptor);
            return;
        }
        options.push_back(std::move(descriptor));
    }

    void OptionRegistry::declare_option(std::string_view widget, std::string_view name, OptionKind kind, std::string_view default_value, std::string_view description) {
        declare_option(widget,
                       OptionDescriptor{
                           .name          = std::string(name),
                           .kind          = kind,
                           .default_value = std::string(default_value),
                           .description   = std::string(description),
                       });
    }

    const OptionDescriptor* OptionRegistry::find(std::string_view widget, std::string_view name) const {
        const auto it = declarations_.find(widget);
        if (it == declarations_.end()) {
            return nullptr;
        }
        const auto match = std::find_if(it->second.begin(), it->second.end(), [&](const OptionDescriptor& option) { return option.name == name; });
        return match == it->second.end() ? nullptr : &*match;
    }

    std::string OptionRegistry::resolve_uncached(std::string_view widget, std::string_view name) const {
        const auto* declared = find(widget, name);
        const auto* standard = find_standard(name);
        const auto  kind     = declared ? declared->kind : (standard ? standard->kind : OptionKind::kString);

        std::string default_value;
        if (declared && !declared->default_value.empty()) {
            default_value = declared->default_value;
        } else if (standard && !standard->default_value.empty()) {
            default_value = standard->default_value;
        } else if (auto fallback = fallbacks_.get(widget, name)) {
            default_value = std::move(*fallback);
        }

        auto value = default_value;
        if (auto host_value = host_.get(host_option_name(widget, name)); host_value && !host_value->empty()) {
            value = std::move(*host_value);
        }
        return validate(kind, std::move(value), default_value);
    }

    std::string OptionRegistry::resolve(std::string_view widget, std::string_view name) {
        auto key = memo_key(widget, name);
        if (const auto it = memo_.find(key); it != memo_.end()) {
            return it->second;
        }
        auto value = resolve_uncached(widget, name);
        memo_.emplace(std::move(key), value);
        return value;
    }

    std::optional<int64_t> OptionRegistry::resolve_int(std::string_view widget, std::string_view name) {
        return parse_int(resolve(widget, name));
    }

    bool OptionRegistry::resolve_bool(std::string_view widget, std::string_view name) {
        return parse_bool_word(resolve(widget, name)).value_or(false);
    }

    void OptionRegistry::clear_cache() {
        memo_.clear();
    }

    void OptionRegistry::clear_cache(std::string_view widget) {
        std::string prefix(widget);
        prefix.push_back('\0');
        std::erase_if(memo_, [&](const auto& entry) { return entry.first.starts_with(prefix); });
    }

    std::size_t OptionRegistry::memoized_count() const {
        return memo_.size();
    }

    std::vector<OptionDescriptor> OptionRegistry::declared_options(std::string_view widget) const {
        const auto it = declarations_.find(widget);
        if (it == declarations_.end()) {
            return {};
        }
        return it->second;
    }

    std::vector<std::string> OptionRegistry::declared_widgets() const {
        std::vector<std::string> widgets;
        widgets.reserve(declarations_.size());
        for (const auto& [widget, options] : declarations_) {
            widgets.push_back(widget);
        }
        return widgets;
    }

    std::string render_options_text(OptionRegistry& registry, std::string_view widget_filter) {
        std::ostringstream out;
        bool               first = true;
        for (const auto& widget : registry.declared_widgets()) {
            if (!widget_filter.empty() && widget != widget_filter) {
                continue;
            }
            if (!first) {
                out << '\n';
            }
            first = false;
            out << "[" << widget << "]\n";
            for (const auto& option : registry.declared_options(widget)) {
                out << "  " << host_option_name(widget, option.name) << " (" << option_kind_name(option.kind) << ")\n";
                out << "    value:   \"" << registry.resolve(widget, option.name) << "\"\n";
                out << "    default: \"" << option.default_value << "\"\n";
                if (!option.description.empty()) {
                    out << "    " << option.description << '\n';
                }
            }
        }
        return out.str();
    }

    std::string render_options_json(OptionRegistry& registry, std::string_view widget_filter) {
        nlohmann::json root = nlohmann::json::object();
        for (const auto& widget : registry.declared_widgets()) {
            if (!widget_filter.empty() && widget != widget_filter) {
                continue;
            }
            nlohmann::json entries = nlohmann::json::array();
            for (const auto& option : registry.declared_options(widget)) {
                nlohmann::json entry;
                entry["name"]        = option.name;
                entry["option"]      = host_option_name(widget, option.name);
                entry["kind"]        = std::string(option_kind_name(option.kind));
                entry["default"]     = option.default_value;
                entry["value"]       = registry.resolve(widget, option.name);
                entry["description"] = option.description;
                entries.push_back(std::move(entry));
            }
            root[widget] = std::move(entries);
        }
        return root.dump(2);
    }

} // namespace statuskit
