#ifndef STATUSKIT_SEVERITY_HPP
#define STATUSKIT_SEVERITY_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace statuskit {

    enum class SeverityLevel : std::uint8_t {
        kInactive = 0,
        kNormal   = 1,
        kInfo     = 2,
        kWarning  = 3,
        kError    = 4,
    };

    constexpr int severity_rank(SeverityLevel level) noexcept {
        return static_cast<int>(level);
    }

    enum class DisplayCondition : std::uint8_t {
        kAlways,
        kEq,
        kLt,
        kLte,
        kGt,
        kGte,
    };

    struct VisibilityRule {
        DisplayCondition             condition = DisplayCondition::kAlways;
        std::optional<SeverityLevel> threshold;
    };

    enum class ThresholdMode : std::uint8_t {
        kNone,
        kNormal,
        kInverted,
    };

    struct ThresholdConfig {
        ThresholdMode mode     = ThresholdMode::kNone;
        int64_t       warning  = 0;
        int64_t       critical = 0;
    };

    struct SeverityColors {
        std::string_view accent;
        std::string_view accent_icon;
    };

    // kNormal mode: value >= critical is an error, value >= warning a warning.
    // kInverted uses <= with the same thresholds. kInfo and kInactive are only
    // ever set explicitly by a widget.
    SeverityLevel  compute_severity(std::optional<int64_t> value, const ThresholdConfig& config) noexcept;

    // Unknown comparators show the widget.
    bool           is_visible(SeverityLevel current, const VisibilityRule& rule) noexcept;

    // The legacy show_only_warning flag hides anything at kNormal or below, in
    // addition to the visibility rule.
    bool           should_display(SeverityLevel current, const VisibilityRule& rule, bool show_only_warning) noexcept;

    SeverityColors severity_colors(SeverityLevel level) noexcept;

    std::string_view                severity_name(SeverityLevel level) noexcept;
    SeverityLevel                   parse_severity(std::string_view value);
    std::optional<SeverityLevel>    parse_severity_strict(std::string_view value);
    ThresholdMode                   parse_threshold_mode(std::string_view value);
    std::optional<DisplayCondition> parse_display_condition(std::string_view value);

} // namespace statuskit

#endif // STATUSKIT_SEVERITY_HPP
