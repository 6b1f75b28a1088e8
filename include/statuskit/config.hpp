#ifndef STATUSKIT_CONFIG_HPP
#define STATUSKIT_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>

#include "statuskit/option_source.hpp"

namespace statuskit {

    enum class SeparatorStyle {
        kRounded,
        kNormal,
    };

    enum class Spacing {
        kNone,
        kBoth,
        kWidgetsOnly,
    };

    inline constexpr std::string_view kDefaultThemeName       = "tokyo-night";
    inline constexpr int              kDefaultCommandTimeoutMs = 5000;

    struct Config {
        std::string                theme            = std::string(kDefaultThemeName);
        std::optional<std::string> theme_file;
        bool                       transparent      = false;
        SeparatorStyle             separator_style  = SeparatorStyle::kRounded;
        Spacing                    spacing          = Spacing::kNone;
        std::string                status_bg        = "surface";
        std::string                text_color       = "white";
        bool                       debug_logging    = false;
        std::optional<std::string> cache_directory;
        int                        command_timeout_ms = kDefaultCommandTimeoutMs;
    };

    struct ConfigOverrides {
        std::optional<std::string>    theme;
        std::optional<std::string>    theme_file;
        std::optional<bool>           transparent;
        std::optional<SeparatorStyle> separator_style;
        std::optional<Spacing>        spacing;
        std::optional<std::string>    status_bg;
        std::optional<std::string>    text_color;
        std::optional<bool>           debug_logging;
        std::optional<std::string>    cache_directory;
        std::optional<int>            command_timeout_ms;
    };

    std::optional<SeparatorStyle> parse_separator_style(std::string_view value);
    std::optional<Spacing>        parse_spacing(std::string_view value);
    std::optional<bool>           parse_bool_word(std::string_view value);
    Config                        apply_overrides(const Config& base, const ConfigOverrides& overrides);
    std::optional<std::string>    normalize_override_string(std::string_view value);

    // Reads the @statuskit_* global options. Unparseable values are dropped so
    // the built-in default stays in effect.
    ConfigOverrides config_overrides_from_options(const OptionSource& options);

} // namespace statuskit

#endif // STATUSKIT_CONFIG_HPP
