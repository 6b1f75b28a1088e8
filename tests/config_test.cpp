#include <gtest/gtest.h>

#include "statuskit/config.hpp"
#include "statuskit/option_source.hpp"

TEST(ConfigParse, ParsesSeparatorStyle) {
    EXPECT_EQ(statuskit::parse_separator_style("rounded"), statuskit::SeparatorStyle::kRounded);
    EXPECT_EQ(statuskit::parse_separator_style(" Normal "), statuskit::SeparatorStyle::kNormal);
    EXPECT_EQ(statuskit::parse_separator_style("slanted"), std::nullopt);
}

TEST(ConfigParse, ParsesSpacingAliases) {
    EXPECT_EQ(statuskit::parse_spacing("false"), statuskit::Spacing::kNone);
    EXPECT_EQ(statuskit::parse_spacing("windows"), statuskit::Spacing::kNone);
    EXPECT_EQ(statuskit::parse_spacing("both"), statuskit::Spacing::kBoth);
    EXPECT_EQ(statuskit::parse_spacing("true"), statuskit::Spacing::kBoth);
    EXPECT_EQ(statuskit::parse_spacing("plugins"), statuskit::Spacing::kWidgetsOnly);
    EXPECT_EQ(statuskit::parse_spacing("sometimes"), std::nullopt);
}

TEST(ConfigParse, ParsesBoolWords) {
    EXPECT_EQ(statuskit::parse_bool_word("yes"), true);
    EXPECT_EQ(statuskit::parse_bool_word("ON"), true);
    EXPECT_EQ(statuskit::parse_bool_word("0"), false);
    EXPECT_EQ(statuskit::parse_bool_word("maybe"), std::nullopt);
}

TEST(ConfigOverrides, DefaultsAreStable) {
    const statuskit::Config config;

    EXPECT_EQ(config.theme, "tokyo-night");
    EXPECT_FALSE(config.theme_file.has_value());
    EXPECT_FALSE(config.transparent);
    EXPECT_EQ(config.separator_style, statuskit::SeparatorStyle::kRounded);
    EXPECT_EQ(config.spacing, statuskit::Spacing::kNone);
    EXPECT_EQ(config.status_bg, "surface");
    EXPECT_EQ(config.text_color, "white");
    EXPECT_EQ(config.command_timeout_ms, 5000);
}

TEST(ConfigOverrides, AppliesOverrides) {
    const statuskit::Config          base;
    const statuskit::ConfigOverrides overrides{
        .theme              = std::string("catppuccin-mocha"),
        .theme_file         = std::string("/tmp/theme.json"),
        .transparent        = true,
        .separator_style    = statuskit::SeparatorStyle::kNormal,
        .spacing            = statuskit::Spacing::kBoth,
        .status_bg          = std::string("background"),
        .text_color         = std::string("black"),
        .debug_logging      = true,
        .cache_directory    = std::string("tmux-bar"),
        .command_timeout_ms = 250,
    };

    const auto merged = statuskit::apply_overrides(base, overrides);

    EXPECT_EQ(merged.theme, "catppuccin-mocha");
    ASSERT_TRUE(merged.theme_file.has_value());
    EXPECT_EQ(*merged.theme_file, "/tmp/theme.json");
    EXPECT_TRUE(merged.transparent);
    EXPECT_EQ(merged.separator_style, statuskit::SeparatorStyle::kNormal);
    EXPECT_EQ(merged.spacing, statuskit::Spacing::kBoth);
    EXPECT_EQ(merged.status_bg, "background");
    EXPECT_EQ(merged.text_color, "black");
    EXPECT_TRUE(merged.debug_logging);
    ASSERT_TRUE(merged.cache_directory.has_value());
    EXPECT_EQ(*merged.cache_directory, "tmux-bar");
    EXPECT_EQ(merged.command_timeout_ms, 250);
}

TEST(ConfigOverrides, KeepsBaseWhenOverridesMissing) {
    statuskit::Config base;
    base.theme = "custom";

    const auto merged = statuskit::apply_overrides(base, statuskit::ConfigOverrides{});

    EXPECT_EQ(merged.theme, "custom");
    EXPECT_EQ(merged.status_bg, "surface");
}

TEST(ConfigOverrides, NormalizesOverrideStrings) {
    EXPECT_EQ(statuskit::normalize_override_string("  nord  "), "nord");
    EXPECT_EQ(statuskit::normalize_override_string("   "), std::nullopt);
}

TEST(ConfigOverrides, ReadsHostOptions) {
    const statuskit::MapOptionSource options({
        {"@statuskit_theme", " nord "},
        {"@statuskit_transparent", "on"},
        {"@statuskit_separator_style", "normal"},
        {"@statuskit_elements_spacing", "plugins"},
        {"@statuskit_status_bg", "default"},
        {"@statuskit_debug", "1"},
        {"@statuskit_command_timeout", "1500"},
    });

    const auto overrides = statuskit::config_overrides_from_options(options);

    EXPECT_EQ(overrides.theme, "nord");
    EXPECT_EQ(overrides.transparent, true);
    EXPECT_EQ(overrides.separator_style, statuskit::SeparatorStyle::kNormal);
    EXPECT_EQ(overrides.spacing, statuskit::Spacing::kWidgetsOnly);
    EXPECT_EQ(overrides.status_bg, "default");
    EXPECT_EQ(overrides.debug_logging, true);
    EXPECT_EQ(overrides.command_timeout_ms, 1500);
    EXPECT_FALSE(overrides.theme_file.has_value());
    EXPECT_FALSE(overrides.text_color.has_value());
}

TEST(ConfigOverrides, DropsUnparseableHostOptions) {
    const statuskit::MapOptionSource options({
        {"@statuskit_transparent", "sometimes"},
        {"@statuskit_separator_style", "zigzag"},
        {"@statuskit_command_timeout", "-5"},
        {"@statuskit_theme", "   "},
    });

    const auto overrides = statuskit::config_overrides_from_options(options);
    const auto merged    = statuskit::apply_overrides(statuskit::Config{}, overrides);

    EXPECT_FALSE(merged.transparent);
    EXPECT_EQ(merged.separator_style, statuskit::SeparatorStyle::kRounded);
    EXPECT_EQ(merged.command_timeout_ms, 5000);
    EXPECT_EQ(merged.theme, "tokyo-night");
}
