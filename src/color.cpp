#include "statuskit/color.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "statuskit/file_io.hpp"
#include "statuskit/logging.hpp"

namespace statuskit {

    namespace {

        constexpr std::array<std::string_view, 11> kColorsWithVariants = {
            "primary", "secondary", "active", "accent", "info", "success", "warning", "error", "disabled", "surface", "border",
        };

        struct VariantStep {
            std::string_view suffix;
            double           percent;
            bool             toward_white;
        };

        constexpr std::array<VariantStep, 6> kVariantSteps = {{
            {"-light", kLightPercent, true},
            {"-lighter", kLighterPercent, true},
            {"-lightest", kLightestPercent, true},
            {"-dark", kDarkPercent, false},
            {"-darker", kDarkerPercent, false},
            {"-darkest", kDarkestPercent, false},
        }};

        constexpr std::array<VariantStep, 2> kDerivedSteps = {{
            {"-subtle", kSubtlePercent, true},
            {"-strong", kStrongPercent, false},
        }};

        bool is_hex_digit(char ch) {
            return std::isxdigit(static_cast<unsigned char>(ch)) != 0;
        }

        int hex_value(char ch) {
            if (ch >= '0' && ch <= '9') {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f') {
                return 10 + (ch - 'a');
            }
            return 10 + (ch - 'A');
        }

        // Percentages carry one decimal place, so 18.9 becomes 189 parts per
        // thousand and all channel math stays in integers.
        int per_mille(double percent) {
            const auto scaled = static_cast<int>(std::lround(percent * 10.0));
            return std::clamp(scaled, 0, 1000);
        }

        std::optional<std::string> universal_color(std::string_view name) {
            if (name == "transparent" || name == "none") {
                return std::string("NONE");
            }
            if (name == "white") {
                return std::string("#ffffff");
            }
            if (name == "black") {
                return std::string("#000000");
            }
            return std::nullopt;
        }

        bool ends_with(std::string_view value, std::string_view suffix) {
            return value.size() > suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
        }

    } // namespace

    std::optional<Rgb> parse_hex_color(std::string_view hex) {
        if (!hex.empty() && hex.front() == '#') {
            hex.remove_prefix(1);
        }
        if (hex.size() != 6 || !std::all_of(hex.begin(), hex.end(), is_hex_digit)) {
            return std::nullopt;
        }
        const auto byte_at = [&](size_t offset) { return hex_value(hex[offset]) * 16 + hex_value(hex[offset + 1]); };
        return Rgb{byte_at(0), byte_at(2), byte_at(4)};
    }

    std::string to_hex(const Rgb& color) {
        std::ostringstream out;
        out << '#' << std::hex << std::nouppercase;
        for (const int channel : {color.r, color.g, color.b}) {
            out.width(2);
            out.fill('0');
            out << std::clamp(channel, 0, 255);
        }
        return out.str();
    }

    Rgb lighten(const Rgb& color, double percent) {
        const int  p       = per_mille(percent);
        const auto channel = [p](int value) { return value + (255 - value) * p / 1000; };
        return Rgb{channel(color.r), channel(color.g), channel(color.b)};
    }

    Rgb darken(const Rgb& color, double percent) {
        const int  factor  = 1000 - per_mille(percent);
        const auto channel = [factor](int value) { return value * factor / 1000; };
        return Rgb{channel(color.r), channel(color.g), channel(color.b)};
    }

    Palette default_palette() {
        return Palette{
            .name = std::string("tokyo-night"),
            .colors =
                {
                    {"background", "#1a1b26"},
                    {"surface", "#292e42"},
                    {"text", "#c0caf5"},
                    {"border", "#3b4261"},
                    {"statusbar-bg", "#292e42"},
                    {"statusbar-fg", "#c0caf5"},
                    {"primary", "#7aa2f7"},
                    {"secondary", "#394b70"},
                    {"active", "#565f89"},
                    {"accent", "#bb9af7"},
                    {"info", "#7dcfff"},
                    {"success", "#9ece6a"},
                    {"warning", "#e0af68"},
                    {"error", "#f7768e"},
                    {"disabled", "#414868"},
                },
        };
    }

    std::expected<Palette, std::string> parse_palette_json(std::string_view json_text) {
        const auto root = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
        if (root.is_discarded()) {
            return std::unexpected(std::string("theme is not valid json"));
        }
        if (!root.is_object()) {
            return std::unexpected(std::string("theme root must be an object"));
        }
        const auto colors = root.find("colors");
        if (colors == root.end() || !colors->is_object()) {
            return std::unexpected(std::string("theme is missing a colors object"));
        }

        Palette palette;
        if (const auto name = root.find("name"); name != root.end() && name->is_string()) {
            palette.name = name->get<std::string>();
        }
        for (const auto& [key, value] : colors->items()) {
            if (!value.is_string()) {
                return std::unexpected("theme color '" + key + "' must be a string");
            }
            palette.colors.emplace(key, value.get<std::string>());
        }
        return palette;
    }

    std::expected<Palette, std::string> load_palette_file(const std::filesystem::path& path) {
        const auto contents = read_file_contents(path);
        if (!contents) {
            return std::unexpected("cannot read theme file " + path.string());
        }
        auto palette = parse_palette_json(*contents);
        if (palette && palette->name.empty()) {
            palette->name = path.stem().string();
        }
        return palette;
    }

    ColorResolver::ColorResolver(Palette palette) : palette_(std::move(palette)) {
        for (const auto base_name : kColorsWithVariants) {
            const auto it = palette_.colors.find(std::string(base_name));
            if (it == palette_.colors.end()) {
                continue;
            }
            const auto base = parse_hex_color(it->second);
            if (!base) {
                continue;
            }
            for (const auto& step : kVariantSteps) {
                const auto variant = step.toward_white ? lighten(*base, step.percent) : darken(*base, step.percent);
                variants_.emplace(std::string(base_name) + std::string(step.suffix), to_hex(variant));
            }
        }
    }

    std::optional<std::string> ColorResolver::lookup(std::string_view name) const {
        if (auto universal = universal_color(name)) {
            return universal;
        }
        if (const auto it = palette_.colors.find(std::string(name)); it != palette_.colors.end()) {
            return it->second;
        }
        if (const auto it = variants_.find(std::string(name)); it != variants_.end()) {
            return it->second;
        }
        for (const auto& step : kDerivedSteps) {
            if (!ends_with(name, step.suffix)) {
                continue;
            }
            const auto base_value = lookup(name.substr(0, name.size() - step.suffix.size()));
            if (!base_value) {
                return std::nullopt;
            }
            const auto base = parse_hex_color(*base_value);
            if (!base) {
                return std::nullopt;
            }
            return to_hex(step.toward_white ? lighten(*base, step.percent) : darken(*base, step.percent));
        }
        if (name == "default" || (name.starts_with('#') && parse_hex_color(name))) {
            return std::string(name);
        }
        return std::nullopt;
    }

    std::string ColorResolver::resolve(std::string_view name) const {
        if (name.empty()) {
            return {};
        }
        if (auto value = lookup(name)) {
            return std::move(*value);
        }
        debug_log("color", "unknown color '" + std::string(name) + "' in palette " + palette_.name);
        return {};
    }

    bool ColorResolver::has(std::string_view name) const {
        return !name.empty() && lookup(name).has_value();
    }

    const std::string& ColorResolver::palette_name() const {
        return palette_.name;
    }

    std::map<std::string, std::string> ColorResolver::all_colors() const {
        std::map<std::string, std::string> colors(variants_.begin(), variants_.end());
        for (const auto& [name, value] : palette_.colors) {
            colors[name] = value;
        }
        for (const auto name : {"transparent", "white", "black"}) {
            colors[name] = *universal_color(name);
        }
        return colors;
    }

} // namespace statuskit
