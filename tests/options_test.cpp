#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "statuskit/option_source.hpp"
#include "statuskit/options.hpp"

namespace {

    void declare_cpu_options(statuskit::OptionRegistry& registry) {
        registry.declare_option("cpu", "icon", statuskit::OptionKind::kIcon, "C", "Widget icon");
        registry.declare_option("cpu", "warning_threshold", statuskit::OptionKind::kNumber, "70", "Warning level");
        registry.declare_option("cpu", "show_only_warning", statuskit::OptionKind::kBool, "false", "Hide while normal");
        registry.declare_option("cpu", "accent_color", statuskit::OptionKind::kColor, "", "Segment color");
    }

} // namespace

TEST(OptionKinds, RoundTripNames) {
    EXPECT_EQ(statuskit::option_kind_name(statuskit::OptionKind::kNumber), "number");
    EXPECT_EQ(statuskit::parse_option_kind(" Color "), statuskit::OptionKind::kColor);
    EXPECT_EQ(statuskit::parse_option_kind("float"), std::nullopt);
}

TEST(OptionNames, UsesWidgetPrefix) {
    EXPECT_EQ(statuskit::host_option_name("cpu", "warning_threshold"), "@statuskit_widget_cpu_warning_threshold");
}

TEST(FallbackDefaults, PrefersWidgetSpecificValue) {
    auto defaults = statuskit::FallbackDefaults::builtin();
    defaults.set("battery", "accent_color", "success");

    EXPECT_EQ(defaults.get("battery", "accent_color"), "success");
    EXPECT_EQ(defaults.get("cpu", "accent_color"), "secondary");
    EXPECT_EQ(defaults.get("cpu", "accent_color_icon"), "active");
    EXPECT_EQ(defaults.get("cpu", "unknown"), std::nullopt);
}

TEST(OptionRegistry, ResolutionIsIdempotent) {
    statuskit::MapOptionSource host(std::unordered_map<std::string, std::string>{{"@statuskit_widget_cpu_icon", "X"}});
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);

    const auto first = registry.resolve("cpu", "icon");
    host.set("@statuskit_widget_cpu_icon", "Y");
    const auto second = registry.resolve("cpu", "icon");

    EXPECT_EQ(first, "X");
    EXPECT_EQ(second, first);
    EXPECT_EQ(registry.memoized_count(), 1u);
}

TEST(OptionRegistry, HostValueOverridesDeclaredDefault) {
    statuskit::MapOptionSource host(std::unordered_map<std::string, std::string>{{"@statuskit_widget_cpu_warning_threshold", "55"}});
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);

    EXPECT_EQ(registry.resolve("cpu", "warning_threshold"), "55");
    EXPECT_EQ(registry.resolve_int("cpu", "warning_threshold"), 55);
}

TEST(OptionRegistry, EmptyHostValueKeepsDefault) {
    statuskit::MapOptionSource host(std::unordered_map<std::string, std::string>{{"@statuskit_widget_cpu_icon", ""}});
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);

    EXPECT_EQ(registry.resolve("cpu", "icon"), "C");
}

TEST(OptionRegistry, EmptyDeclaredDefaultFallsBackToBuiltin) {
    statuskit::MapOptionSource host;
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);

    EXPECT_EQ(registry.resolve("cpu", "accent_color"), "secondary");
    EXPECT_EQ(registry.resolve("cpu", "cache_ttl"), "0");
}

TEST(OptionRegistry, StandardOptionsHaveDefaults) {
    statuskit::MapOptionSource host;
    statuskit::OptionRegistry  registry(host);

    EXPECT_EQ(registry.resolve("memory", "display_condition"), "always");
    EXPECT_EQ(registry.resolve("memory", "display_threshold"), "");
}

TEST(OptionRegistry, UndeclaredUnknownOptionResolvesEmpty) {
    statuskit::MapOptionSource host;
    statuskit::OptionRegistry  registry(host);

    EXPECT_EQ(registry.resolve("memory", "nothing"), "");
    EXPECT_EQ(registry.resolve_int("memory", "nothing"), std::nullopt);
}

TEST(OptionRegistry, InvalidNumberFallsBackToDefault) {
    statuskit::MapOptionSource host(std::unordered_map<std::string, std::string>{{"@statuskit_widget_cpu_warning_threshold", "lots"}});
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);

    EXPECT_EQ(registry.resolve("cpu", "warning_threshold"), "70");
}

TEST(OptionRegistry, NormalizesBooleans) {
    statuskit::MapOptionSource host(std::unordered_map<std::string, std::string>{{"@statuskit_widget_cpu_show_only_warning", "yes"}});
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);

    EXPECT_EQ(registry.resolve("cpu", "show_only_warning"), "true");
    EXPECT_TRUE(registry.resolve_bool("cpu", "show_only_warning"));
}

TEST(OptionRegistry, InvalidBooleanFallsBackToDefault) {
    statuskit::MapOptionSource host(std::unordered_map<std::string, std::string>{{"@statuskit_widget_cpu_show_only_warning", "perhaps"}});
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);

    EXPECT_EQ(registry.resolve("cpu", "show_only_warning"), "false");
    EXPECT_FALSE(registry.resolve_bool("cpu", "show_only_warning"));
}

TEST(OptionRegistry, RedeclarationOverwritesInPlace) {
    statuskit::MapOptionSource host;
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);

    registry.declare_option("cpu", "icon", statuskit::OptionKind::kIcon, "Z", "Replaced");

    const auto options = registry.declared_options("cpu");
    ASSERT_EQ(options.size(), 4u);
    EXPECT_EQ(options[0].name, "icon");
    EXPECT_EQ(options[0].default_value, "Z");
    ASSERT_NE(registry.find("cpu", "icon"), nullptr);
    EXPECT_EQ(registry.find("cpu", "icon")->description, "Replaced");
    EXPECT_EQ(registry.find("cpu", "missing"), nullptr);
    EXPECT_EQ(registry.find("gpu", "icon"), nullptr);
}

TEST(OptionRegistry, ClearCacheForWidgetOnly) {
    statuskit::MapOptionSource host(std::unordered_map<std::string, std::string>{{"@statuskit_widget_cpu_icon", "X"}});
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);
    (void)registry.resolve("cpu", "icon");
    (void)registry.resolve("memory", "display_condition");

    host.set("@statuskit_widget_cpu_icon", "Y");
    registry.clear_cache("cpu");

    EXPECT_EQ(registry.memoized_count(), 1u);
    EXPECT_EQ(registry.resolve("cpu", "icon"), "Y");

    registry.clear_cache();
    EXPECT_EQ(registry.memoized_count(), 0u);
}

TEST(OptionsViewer, RendersTextForFilteredWidget) {
    statuskit::MapOptionSource host(std::unordered_map<std::string, std::string>{{"@statuskit_widget_cpu_warning_threshold", "60"}});
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);
    registry.declare_option("memory", "icon", statuskit::OptionKind::kIcon, "M", "Widget icon");

    const auto text = statuskit::render_options_text(registry, "cpu");

    EXPECT_TRUE(text.starts_with("[cpu]\n"));
    EXPECT_NE(text.find("@statuskit_widget_cpu_warning_threshold (number)"), std::string::npos);
    EXPECT_NE(text.find("value:   \"60\""), std::string::npos);
    EXPECT_NE(text.find("default: \"70\""), std::string::npos);
    EXPECT_EQ(text.find("[memory]"), std::string::npos);
}

TEST(OptionsViewer, RendersJsonForAllWidgets) {
    statuskit::MapOptionSource host;
    statuskit::OptionRegistry  registry(host);
    declare_cpu_options(registry);
    registry.declare_option("memory", "icon", statuskit::OptionKind::kIcon, "M", "Widget icon");

    const auto json = nlohmann::json::parse(statuskit::render_options_json(registry));

    ASSERT_TRUE(json.contains("cpu"));
    ASSERT_TRUE(json.contains("memory"));
    ASSERT_EQ(json["cpu"].size(), 4u);
    EXPECT_EQ(json["cpu"][1]["name"], "warning_threshold");
    EXPECT_EQ(json["cpu"][1]["option"], "@statuskit_widget_cpu_warning_threshold");
    EXPECT_EQ(json["cpu"][1]["kind"], "number");
    EXPECT_EQ(json["cpu"][1]["value"], "70");
    EXPECT_EQ(json["memory"][0]["default"], "M");
}
