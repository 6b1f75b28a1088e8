#include <gtest/gtest.h>

#include "statuskit/option_source.hpp"
#include "statuskit/widget.hpp"

namespace {

    statuskit::OptionRegistry make_registry(const statuskit::OptionSource& host) {
        statuskit::OptionRegistry registry(host);
        statuskit::declare_common_options(registry, "cpu", "C", "5");
        statuskit::declare_threshold_options(registry, "cpu", statuskit::ThresholdMode::kNormal, 70, 90);
        return registry;
    }

} // namespace

TEST(WidgetType, ParsesNames) {
    EXPECT_EQ(statuskit::parse_widget_type("static"), statuskit::WidgetType::kStatic);
    EXPECT_EQ(statuskit::parse_widget_type("Conditional"), statuskit::WidgetType::kConditional);
    EXPECT_EQ(statuskit::parse_widget_type("dynamic"), statuskit::WidgetType::kConditional);
    EXPECT_EQ(statuskit::parse_widget_type("other"), std::nullopt);
}

TEST(WidgetOptions, DeclaresCommonAndThresholdOptions) {
    const statuskit::MapOptionSource host;
    auto                             registry = make_registry(host);

    EXPECT_EQ(registry.resolve("cpu", "icon"), "C");
    EXPECT_EQ(registry.resolve("cpu", "accent_color"), "secondary");
    EXPECT_EQ(registry.resolve("cpu", "cache_ttl"), "5");
    EXPECT_EQ(registry.resolve("cpu", "threshold_mode"), "normal");
    EXPECT_EQ(registry.declared_options("cpu").size(), 8u);
}

TEST(WidgetOptions, ReadsThresholdConfig) {
    const statuskit::MapOptionSource host({{"@statuskit_widget_cpu_threshold_mode", "inverted"}, {"@statuskit_widget_cpu_warning_threshold", "40"}});
    auto                             registry = make_registry(host);

    const auto config = statuskit::threshold_config_from_options(registry, "cpu");

    EXPECT_EQ(config.mode, statuskit::ThresholdMode::kInverted);
    EXPECT_EQ(config.warning, 40);
    EXPECT_EQ(config.critical, 90);
}

TEST(WidgetOptions, MissingThresholdDisablesMode) {
    const statuskit::MapOptionSource host(std::unordered_map<std::string, std::string>{{"@statuskit_widget_gpu_threshold_mode", "normal"}});
    statuskit::OptionRegistry        registry(host);

    EXPECT_EQ(statuskit::threshold_config_from_options(registry, "gpu").mode, statuskit::ThresholdMode::kNone);
}

TEST(WidgetOptions, ReadsVisibilityRule) {
    const statuskit::MapOptionSource host({{"@statuskit_widget_cpu_display_condition", "gte"}, {"@statuskit_widget_cpu_display_threshold", "warning"}});
    auto                             registry = make_registry(host);

    const auto rule = statuskit::visibility_rule_from_options(registry, "cpu");

    EXPECT_EQ(rule.condition, statuskit::DisplayCondition::kGte);
    EXPECT_EQ(rule.threshold, statuskit::SeverityLevel::kWarning);
}

TEST(WidgetOptions, UnknownDisplayConditionShows) {
    const statuskit::MapOptionSource host({{"@statuskit_widget_cpu_display_condition", "between"}, {"@statuskit_widget_cpu_display_threshold", "error"}});
    auto                             registry = make_registry(host);

    const auto rule = statuskit::visibility_rule_from_options(registry, "cpu");

    EXPECT_EQ(rule.condition, statuskit::DisplayCondition::kAlways);
    EXPECT_TRUE(statuskit::threshold_display_info(registry, "cpu", "10%", 10).visible);
}

TEST(ThresholdDisplayInfo, ColorsBySeverity) {
    const statuskit::MapOptionSource host;
    auto                             registry = make_registry(host);

    const auto error   = statuskit::threshold_display_info(registry, "cpu", "95%", 95);
    const auto warning = statuskit::threshold_display_info(registry, "cpu", "75%", 75);
    const auto normal  = statuskit::threshold_display_info(registry, "cpu", "10%", 10);

    EXPECT_TRUE(error.visible);
    EXPECT_EQ(error.accent, "error");
    EXPECT_EQ(error.accent_icon, "error-subtle");
    EXPECT_EQ(warning.accent, "warning");
    EXPECT_TRUE(normal.visible);
    EXPECT_TRUE(normal.accent.empty());
    EXPECT_TRUE(normal.accent_icon.empty());
}

TEST(ThresholdDisplayInfo, HidesEmptyAndUnavailableContent) {
    const statuskit::MapOptionSource host;
    auto                             registry = make_registry(host);

    EXPECT_FALSE(statuskit::threshold_display_info(registry, "cpu", "", 95).visible);
    EXPECT_FALSE(statuskit::threshold_display_info(registry, "cpu", "N/A", std::nullopt).visible);
}

TEST(ThresholdDisplayInfo, ShowOnlyWarningHidesCalmValues) {
    const statuskit::MapOptionSource host(std::unordered_map<std::string, std::string>{{"@statuskit_widget_cpu_show_only_warning", "true"}});
    auto                             registry = make_registry(host);

    EXPECT_FALSE(statuskit::threshold_display_info(registry, "cpu", "10%", 10).visible);
    EXPECT_TRUE(statuskit::threshold_display_info(registry, "cpu", "75%", 75).visible);
}

TEST(SeverityDisplayInfo, AppliesVisibilityRule) {
    const statuskit::MapOptionSource host({{"@statuskit_widget_cpu_display_condition", "gt"}, {"@statuskit_widget_cpu_display_threshold", "normal"}});
    auto                             registry = make_registry(host);

    EXPECT_FALSE(statuskit::severity_display_info(registry, "cpu", "0.5", statuskit::SeverityLevel::kNormal).visible);
    const auto info = statuskit::severity_display_info(registry, "cpu", "3.2", statuskit::SeverityLevel::kInfo);
    EXPECT_TRUE(info.visible);
    EXPECT_EQ(info.accent, "info");
}

TEST(CleanContent, StripsStatePrefixes) {
    EXPECT_EQ(statuskit::clean_content("charging:80%"), "80%");
    EXPECT_EQ(statuskit::clean_content("MODIFIED:main"), "main");
    EXPECT_EQ(statuskit::clean_content("12:30"), "12:30");
    EXPECT_EQ(statuskit::clean_content("Mon 12:30"), "Mon 12:30");
    EXPECT_EQ(statuskit::clean_content("plain"), "plain");
}
