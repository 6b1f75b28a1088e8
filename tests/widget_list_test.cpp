#include <gtest/gtest.h>

#include "statuskit/widget_list.hpp"

TEST(WidgetList, ParsesInternalEntryFields) {
    const auto entry = statuskit::parse_widget_entry("cpu:warning:warning-subtle:C:conditional");

    ASSERT_TRUE(entry.has_value());
    const auto* internal = std::get_if<statuskit::InternalEntry>(&*entry);
    ASSERT_NE(internal, nullptr);
    EXPECT_EQ(internal->name, "cpu");
    EXPECT_EQ(internal->accent, "warning");
    EXPECT_EQ(internal->accent_icon, "warning-subtle");
    EXPECT_EQ(internal->icon, "C");
    EXPECT_EQ(internal->type, statuskit::WidgetType::kConditional);
}

TEST(WidgetList, BareNameLeavesOptionalFieldsEmpty) {
    const auto entry = statuskit::parse_widget_entry("datetime");

    ASSERT_TRUE(entry.has_value());
    const auto& internal = std::get<statuskit::InternalEntry>(*entry);
    EXPECT_EQ(internal.name, "datetime");
    EXPECT_TRUE(internal.accent.empty());
    EXPECT_TRUE(internal.icon.empty());
    EXPECT_FALSE(internal.type.has_value());
}

TEST(WidgetList, AcceptsDynamicAsConditional) {
    const auto entry = statuskit::parse_widget_entry("battery::::dynamic");

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(std::get<statuskit::InternalEntry>(*entry).type, statuskit::WidgetType::kConditional);
}

TEST(WidgetList, UnknownTypeIsIgnored) {
    const auto entry = statuskit::parse_widget_entry("battery::::sometimes");

    ASSERT_TRUE(entry.has_value());
    EXPECT_FALSE(std::get<statuskit::InternalEntry>(*entry).type.has_value());
}

TEST(WidgetList, ParsesExternalEntry) {
    const auto entry = statuskit::parse_widget_entry("EXTERNAL|K|#(kubectl config current-context)|info|info-subtle|30|kube|#{?client_prefix,1,0}");

    ASSERT_TRUE(entry.has_value());
    const auto* external = std::get_if<statuskit::ExternalEntry>(&*entry);
    ASSERT_NE(external, nullptr);
    EXPECT_EQ(external->icon, "K");
    EXPECT_EQ(external->content, "#(kubectl config current-context)");
    EXPECT_EQ(external->accent, "info");
    EXPECT_EQ(external->accent_icon, "info-subtle");
    EXPECT_EQ(external->ttl, 30);
    EXPECT_EQ(external->name, "kube");
    EXPECT_EQ(external->condition, "#{?client_prefix,1,0}");
}

TEST(WidgetList, ExternalDefaultsNameAndTtl) {
    const auto entry = statuskit::parse_widget_entry("EXTERNAL|*|hello|||");

    ASSERT_TRUE(entry.has_value());
    const auto& external = std::get<statuskit::ExternalEntry>(*entry);
    EXPECT_EQ(external.name, "external");
    EXPECT_EQ(external.ttl, 0);
    EXPECT_TRUE(external.condition.empty());
}

TEST(WidgetList, RejectsExternalWithoutContent) {
    EXPECT_FALSE(statuskit::parse_widget_entry("EXTERNAL|*||secondary").has_value());
}

TEST(WidgetList, SplitsOnSemicolonsAndSkipsEmptyEntries) {
    const auto entries = statuskit::parse_widget_list("cpu;; memory ;EXTERNAL|*|hi|||0;:nameless");

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(std::get<statuskit::InternalEntry>(entries[0]).name, "cpu");
    EXPECT_EQ(std::get<statuskit::InternalEntry>(entries[1]).name, "memory");
    EXPECT_EQ(std::get<statuskit::ExternalEntry>(entries[2]).content, "hi");
}

TEST(WidgetList, EmptyListHasNoEntries) {
    EXPECT_TRUE(statuskit::parse_widget_list("").empty());
    EXPECT_TRUE(statuskit::parse_widget_list(" ; ").empty());
}
