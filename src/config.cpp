#include "statuskit/config.hpp"

#include <string>

#include "statuskit/strings.hpp"

namespace statuskit {

    namespace {

        std::optional<std::string> read_string(const OptionSource& options, std::string_view name) {
            const auto raw = options.get(name);
            if (!raw) {
                return std::nullopt;
            }
            return normalize_override_string(*raw);
        }

    } // namespace

    std::optional<SeparatorStyle> parse_separator_style(std::string_view value) {
        const auto normalized = to_lower_copy(trim_view(value));
        if (normalized == "rounded") {
            return SeparatorStyle::kRounded;
        }
        if (normalized == "normal") {
            return SeparatorStyle::kNormal;
        }
        return std::nullopt;
    }

    std::optional<Spacing> parse_spacing(std::string_view value) {
        const auto normalized = to_lower_copy(trim_view(value));
        if (normalized == "false" || normalized == "none" || normalized == "windows") {
            return Spacing::kNone;
        }
        if (normalized == "both" || normalized == "true") {
            return Spacing::kBoth;
        }
        if (normalized == "plugins" || normalized == "widgets") {
            return Spacing::kWidgetsOnly;
        }
        return std::nullopt;
    }

    std::optional<bool> parse_bool_word(std::string_view value) {
        const auto normalized = to_lower_copy(trim_view(value));
        if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
            return true;
        }
        if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
            return false;
        }
        return std::nullopt;
    }

    Config apply_overrides(const Config& base, const ConfigOverrides& overrides) {
        Config merged = base;
        if (overrides.theme) {
            merged.theme = *overrides.theme;
        }
        if (overrides.theme_file) {
            merged.theme_file = *overrides.theme_file;
        }
        if (overrides.transparent) {
            merged.transparent = *overrides.transparent;
        }
        if (overrides.separator_style) {
            merged.separator_style = *overrides.separator_style;
        }
        if (overrides.spacing) {
            merged.spacing = *overrides.spacing;
        }
        if (overrides.status_bg) {
            merged.status_bg = *overrides.status_bg;
        }
        if (overrides.text_color) {
            merged.text_color = *overrides.text_color;
        }
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        if (overrides.cache_directory) {
            merged.cache_directory = *overrides.cache_directory;
        }
        if (overrides.command_timeout_ms) {
            merged.command_timeout_ms = *overrides.command_timeout_ms;
        }
        return merged;
    }

    std::optional<std::string> normalize_override_string(std::string_view value) {
        const auto trimmed = trim_copy(value);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        return trimmed;
    }

    ConfigOverrides config_overrides_from_options(const OptionSource& options) {
        ConfigOverrides overrides;
        overrides.theme           = read_string(options, "@statuskit_theme");
        overrides.theme_file      = read_string(options, "@statuskit_theme_file");
        overrides.status_bg       = read_string(options, "@statuskit_status_bg");
        overrides.text_color      = read_string(options, "@statuskit_text_color");
        overrides.cache_directory = read_string(options, "@statuskit_cache_directory");
        if (const auto raw = options.get("@statuskit_transparent")) {
            overrides.transparent = parse_bool_word(*raw);
        }
        if (const auto raw = options.get("@statuskit_debug")) {
            overrides.debug_logging = parse_bool_word(*raw);
        }
        if (const auto raw = options.get("@statuskit_separator_style")) {
            overrides.separator_style = parse_separator_style(*raw);
        }
        if (const auto raw = options.get("@statuskit_elements_spacing")) {
            overrides.spacing = parse_spacing(*raw);
        }
        if (const auto raw = options.get("@statuskit_command_timeout")) {
            const auto parsed = parse_int(trim_view(*raw));
            if (parsed && *parsed > 0 && *parsed <= 600000) {
                overrides.command_timeout_ms = static_cast<int>(*parsed);
            }
        }
        return overrides;
    }

} // namespace statuskit
