#include "statuskit/severity.hpp"

#include <string>

#include "statuskit/strings.hpp"

namespace statuskit {

    SeverityLevel compute_severity(std::optional<int64_t> value, const ThresholdConfig& config) noexcept {
        if (!value) {
            return SeverityLevel::kNormal;
        }
        switch (config.mode) {
            case ThresholdMode::kNone: return SeverityLevel::kNormal;
            case ThresholdMode::kNormal:
                if (*value >= config.critical) {
                    return SeverityLevel::kError;
                }
                if (*value >= config.warning) {
                    return SeverityLevel::kWarning;
                }
                return SeverityLevel::kNormal;
            case ThresholdMode::kInverted:
                if (*value <= config.critical) {
                    return SeverityLevel::kError;
                }
                if (*value <= config.warning) {
                    return SeverityLevel::kWarning;
                }
                return SeverityLevel::kNormal;
        }
        return SeverityLevel::kNormal;
    }

    bool is_visible(SeverityLevel current, const VisibilityRule& rule) noexcept {
        if (rule.condition == DisplayCondition::kAlways || !rule.threshold) {
            return true;
        }
        const int lhs = severity_rank(current);
        const int rhs = severity_rank(*rule.threshold);
        switch (rule.condition) {
            case DisplayCondition::kEq: return lhs == rhs;
            case DisplayCondition::kLt: return lhs < rhs;
            case DisplayCondition::kLte: return lhs <= rhs;
            case DisplayCondition::kGt: return lhs > rhs;
            case DisplayCondition::kGte: return lhs >= rhs;
            case DisplayCondition::kAlways: return true;
            default: return true;
        }
    }

    bool should_display(SeverityLevel current, const VisibilityRule& rule, bool show_only_warning) noexcept {
        if (show_only_warning && severity_rank(current) <= severity_rank(SeverityLevel::kNormal)) {
            return false;
        }
        return is_visible(current, rule);
    }

    SeverityColors severity_colors(SeverityLevel level) noexcept {
        switch (level) {
            case SeverityLevel::kInactive: return {"disabled", "disabled"};
            case SeverityLevel::kNormal: return {"secondary", "active"};
            case SeverityLevel::kInfo: return {"info", "info-subtle"};
            case SeverityLevel::kWarning: return {"warning", "warning-subtle"};
            case SeverityLevel::kError: return {"error", "error-subtle"};
        }
        return {"secondary", "active"};
    }

    std::string_view severity_name(SeverityLevel level) noexcept {
        switch (level) {
            case SeverityLevel::kInactive: return "inactive";
            case SeverityLevel::kNormal: return "normal";
            case SeverityLevel::kInfo: return "info";
            case SeverityLevel::kWarning: return "warning";
            case SeverityLevel::kError: return "error";
        }
        return "normal";
    }

    std::optional<SeverityLevel> parse_severity_strict(std::string_view value) {
        const auto normalized = to_lower_copy(trim_view(value));
        if (normalized == "inactive") {
            return SeverityLevel::kInactive;
        }
        if (normalized == "normal" || normalized == "ok") {
            return SeverityLevel::kNormal;
        }
        if (normalized == "info") {
            return SeverityLevel::kInfo;
        }
        if (normalized == "warning") {
            return SeverityLevel::kWarning;
        }
        if (normalized == "error" || normalized == "critical") {
            return SeverityLevel::kError;
        }
        return std::nullopt;
    }

    SeverityLevel parse_severity(std::string_view value) {
        return parse_severity_strict(value).value_or(SeverityLevel::kNormal);
    }

    ThresholdMode parse_threshold_mode(std::string_view value) {
        const auto normalized = to_lower_copy(trim_view(value));
        if (normalized == "normal") {
            return ThresholdMode::kNormal;
        }
        if (normalized == "inverted") {
            return ThresholdMode::kInverted;
        }
        return ThresholdMode::kNone;
    }

    std::optional<DisplayCondition> parse_display_condition(std::string_view value) {
        const auto normalized = to_lower_copy(trim_view(value));
        if (normalized.empty() || normalized == "always") {
            return DisplayCondition::kAlways;
        }
        if (normalized == "eq") {
            return DisplayCondition::kEq;
        }
        if (normalized == "lt") {
            return DisplayCondition::kLt;
        }
        if (normalized == "lte") {
            return DisplayCondition::kLte;
        }
        if (normalized == "gt") {
            return DisplayCondition::kGt;
        }
        if (normalized == "gte") {
            return DisplayCondition::kGte;
        }
        return std::nullopt;
    }

} // namespace statuskit
