#include "statuskit/widget.hpp"

#include "statuskit/strings.hpp"

namespace statuskit {

    namespace {

        std::string_view threshold_mode_name(ThresholdMode mode) {
            switch (mode) {
                case ThresholdMode::kNone: return "none";
                case ThresholdMode::kNormal: return "normal";
                case ThresholdMode::kInverted: return "inverted";
            }
            return "none";
        }

        bool hidden_content(std::string_view content) {
            return content.empty() || content == "N/A";
        }

        DisplayInfo colored(SeverityLevel level) {
            DisplayInfo info;
            // kNormal keeps whatever accent the user configured.
            if (level != SeverityLevel::kNormal) {
                const auto colors = severity_colors(level);
                info.accent       = std::string(colors.accent);
                info.accent_icon  = std::string(colors.accent_icon);
            }
            return info;
        }

    } // namespace

    std::optional<WidgetType> parse_widget_type(std::string_view value) {
        const auto normalized = to_lower_copy(trim_view(value));
        if (normalized == "static") {
            return WidgetType::kStatic;
        }
        if (normalized == "conditional" || normalized == "dynamic") {
            return WidgetType::kConditional;
        }
        return std::nullopt;
    }

    void declare_common_options(OptionRegistry& registry, std::string_view widget, std::string_view icon, std::string_view cache_ttl) {
        registry.declare_option(widget, "icon", OptionKind::kIcon, icon, "Icon shown before the content");
        registry.declare_option(widget, "accent_color", OptionKind::kColor, "secondary", "Content background color");
        registry.declare_option(widget, "accent_color_icon", OptionKind::kColor, "active", "Icon background color");
        registry.declare_option(widget, "cache_ttl", OptionKind::kNumber, cache_ttl, "Seconds a computed value is reused");
    }

    void declare_threshold_options(OptionRegistry& registry, std::string_view widget, ThresholdMode mode, int64_t warning, int64_t critical) {
        registry.declare_option(widget, "threshold_mode", OptionKind::kString, threshold_mode_name(mode), "Threshold mode (none, normal, inverted)");
        registry.declare_option(widget, "warning_threshold", OptionKind::kNumber, std::to_string(warning), "Warning threshold");
        registry.declare_option(widget, "critical_threshold", OptionKind::kNumber, std::to_string(critical), "Critical threshold");
        registry.declare_option(widget, "show_only_warning", OptionKind::kBool, "false", "Only show when a threshold is exceeded");
    }

    ThresholdConfig threshold_config_from_options(OptionRegistry& registry, std::string_view widget) {
        ThresholdConfig config;
        config.mode          = parse_threshold_mode(registry.resolve(widget, "threshold_mode"));
        const auto warning  = registry.resolve_int(widget, "warning_threshold");
        const auto critical = registry.resolve_int(widget, "critical_threshold");
        if (!warning || !critical) {
            config.mode = ThresholdMode::kNone;
            return config;
        }
        config.warning  = *warning;
        config.critical = *critical;
        return config;
    }

    VisibilityRule visibility_rule_from_options(OptionRegistry& registry, std::string_view widget) {
        VisibilityRule rule;
        const auto     condition = parse_display_condition(registry.resolve(widget, "display_condition"));
        if (!condition) {
            return rule;
        }
        rule.condition = *condition;
        if (const auto threshold = registry.resolve(widget, "display_threshold"); !threshold.empty()) {
            rule.threshold = parse_severity(threshold);
        }
        return rule;
    }

    DisplayInfo threshold_display_info(OptionRegistry& registry, std::string_view widget, std::string_view content, std::optional<int64_t> value) {
        if (hidden_content(content)) {
            return DisplayInfo{.visible = false};
        }
        const auto level = compute_severity(value, threshold_config_from_options(registry, widget));
        if (!should_display(level, visibility_rule_from_options(registry, widget), registry.resolve_bool(widget, "show_only_warning"))) {
            return DisplayInfo{.visible = false};
        }
        return colored(level);
    }

    DisplayInfo severity_display_info(OptionRegistry& registry, std::string_view widget, std::string_view content, SeverityLevel level) {
        if (hidden_content(content)) {
            return DisplayInfo{.visible = false};
        }
        if (!is_visible(level, visibility_rule_from_options(registry, widget))) {
            return DisplayInfo{.visible = false};
        }
        return colored(level);
    }

    std::string clean_content(std::string_view content) {
        size_t letters = 0;
        while (letters < content.size() && content[letters] >= 'a' && content[letters] <= 'z') {
            ++letters;
        }
        if (letters > 0 && letters < content.size() && content[letters] == ':') {
            content.remove_prefix(letters + 1);
        }
        constexpr std::string_view kModified = "MODIFIED:";
        if (content.starts_with(kModified)) {
            content.remove_prefix(kModified.size());
        }
        return std::string(content);
    }

} // namespace statuskit
