#ifndef STATUSKIT_COLOR_HPP
#define STATUSKIT_COLOR_HPP

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace statuskit {

    inline constexpr double kSubtlePercent   = 18.9;
    inline constexpr double kStrongPercent   = 44.2;
    inline constexpr double kLightPercent    = 10.0;
    inline constexpr double kLighterPercent  = 18.9;
    inline constexpr double kLightestPercent = 30.0;
    inline constexpr double kDarkPercent     = 15.0;
    inline constexpr double kDarkerPercent   = 30.0;
    inline constexpr double kDarkestPercent  = 44.2;

    struct Rgb {
        int r = 0;
        int g = 0;
        int b = 0;

        bool operator==(const Rgb&) const = default;
    };

    std::optional<Rgb> parse_hex_color(std::string_view hex);
    std::string        to_hex(const Rgb& color);
    Rgb                lighten(const Rgb& color, double percent);
    Rgb                darken(const Rgb& color, double percent);

    struct Palette {
        std::string                                  name;
        std::unordered_map<std::string, std::string> colors;
    };

    Palette                              default_palette();
    std::expected<Palette, std::string> parse_palette_json(std::string_view json_text);
    std::expected<Palette, std::string> load_palette_file(const std::filesystem::path& path);

    // Maps semantic color names (secondary, error-subtle, ...) to concrete
    // tmux color values. Unknown names resolve to an empty string, which tmux
    // treats as "inherit".
    class ColorResolver {
      public:
        explicit ColorResolver(Palette palette);

        std::string                        resolve(std::string_view name) const;
        bool                               has(std::string_view name) const;
        const std::string&                 palette_name() const;
        std::map<std::string, std::string> all_colors() const;

      private:
        std::optional<std::string>                   lookup(std::string_view name) const;

        Palette                                      palette_;
        std::unordered_map<std::string, std::string> variants_;
    };

} // namespace statuskit

#endif // STATUSKIT_COLOR_HPP
