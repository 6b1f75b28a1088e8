#include <filesystem>

#include <gtest/gtest.h>

#include "statuskit/system_stats.hpp"
#include "test_support.hpp"

TEST(ProcStat, ParsesAggregateCpuLine) {
    const auto times = statuskit::parse_proc_stat("cpu  100 0 50 800 50 0 0 0 0 0\n"
                                                  "cpu0 50 0 25 400 25 0 0 0 0 0\n");

    ASSERT_TRUE(times.has_value());
    EXPECT_EQ(times->total, 1000u);
    EXPECT_EQ(times->idle, 850u);
}

TEST(ProcStat, RejectsMissingOrShortLine) {
    EXPECT_EQ(statuskit::parse_proc_stat("cpu0 1 2 3 4\n"), std::nullopt);
    EXPECT_EQ(statuskit::parse_proc_stat("cpu  1 2\n"), std::nullopt);
}

TEST(ProcStat, ComputesRoundedUsage) {
    const statuskit::CpuTimes before{.idle = 850, .total = 1000};
    const statuskit::CpuTimes after{.idle = 1100, .total = 1400};

    EXPECT_EQ(statuskit::cpu_usage_percent(before, after), 38);
    EXPECT_EQ(statuskit::cpu_usage_percent(before, before), 0);
    EXPECT_EQ(statuskit::cpu_usage_percent(after, before), 0);
}

TEST(MemInfo, PrefersMemAvailable) {
    const auto info = statuskit::parse_meminfo("MemTotal:       16000000 kB\n"
                                               "MemFree:         1000000 kB\n"
                                               "MemAvailable:    4000000 kB\n"
                                               "Buffers:          500000 kB\n"
                                               "Cached:          2000000 kB\n");

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->total_kb, 16000000u);
    EXPECT_EQ(info->available_kb, 4000000u);
    EXPECT_EQ(info->used_kb(), 12000000u);
}

TEST(MemInfo, FallsBackToFreeBuffersCached) {
    const auto info = statuskit::parse_meminfo("MemTotal: 1000 kB\nMemFree: 100 kB\nBuffers: 50 kB\nCached: 250 kB\n");

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->available_kb, 400u);
}

TEST(MemInfo, RejectsMissingTotal) {
    EXPECT_EQ(statuskit::parse_meminfo("MemFree: 100 kB\n"), std::nullopt);
}

TEST(LoadAvg, ParsesThreeAverages) {
    const auto load = statuskit::parse_loadavg("0.52 1.25 2.00 1/345 6789\n");

    ASSERT_TRUE(load.has_value());
    EXPECT_EQ(load->one, "0.52");
    EXPECT_EQ(load->five, "1.25");
    EXPECT_EQ(load->fifteen, "2.00");
    EXPECT_EQ(statuskit::parse_loadavg("0.5"), std::nullopt);
}

TEST(LoadAvg, ScalesToHundredths) {
    EXPECT_EQ(statuskit::load_hundredths("1.25"), 125);
    EXPECT_EQ(statuskit::load_hundredths("0.5"), 50);
    EXPECT_EQ(statuskit::load_hundredths("3"), 300);
    EXPECT_EQ(statuskit::load_hundredths("abc"), std::nullopt);
}

TEST(Uptime, ParsesAndFormats) {
    EXPECT_EQ(statuskit::parse_uptime_seconds("93784.52 180000.10\n"), 93784);
    EXPECT_EQ(statuskit::format_uptime(93784), "1d 2h");
    EXPECT_EQ(statuskit::format_uptime(7500), "2h 5m");
    EXPECT_EQ(statuskit::format_uptime(59), "0m");
    EXPECT_EQ(statuskit::format_uptime(-5), "0m");
}

TEST(BytesToHuman, UsesGigabytesAboveOneGib) {
    EXPECT_EQ(statuskit::bytes_to_human(3 * statuskit::kBytesPerGb / 2), "1.5G");
    EXPECT_EQ(statuskit::bytes_to_human(512 * statuskit::kBytesPerMb), "512M");
}

TEST(HumanToBytes, ReadsSuffixedSizes) {
    EXPECT_EQ(statuskit::human_to_bytes("1.5G"), 3 * statuskit::kBytesPerGb / 2);
    EXPECT_EQ(statuskit::human_to_bytes(" 512M "), 512 * statuskit::kBytesPerMb);
    EXPECT_EQ(statuskit::human_to_bytes("2T"), 2 * statuskit::kBytesPerTb);
    EXPECT_EQ(statuskit::human_to_bytes("G"), std::nullopt);
    EXPECT_EQ(statuskit::human_to_bytes("12X"), std::nullopt);
    EXPECT_EQ(statuskit::human_to_bytes("-1G"), std::nullopt);
}

TEST(Battery, ReadsFirstBatterySupply) {
    const auto root = statuskit::testing::make_temp_dir("sys");
    statuskit::testing::write_file(root / "class/power_supply/AC/type", "Mains\n");
    statuskit::testing::write_file(root / "class/power_supply/BAT0/type", "Battery\n");
    statuskit::testing::write_file(root / "class/power_supply/BAT0/capacity", "87\n");
    statuskit::testing::write_file(root / "class/power_supply/BAT0/status", "Discharging\n");

    const auto battery = statuskit::read_battery(root);

    ASSERT_TRUE(battery.has_value());
    EXPECT_EQ(battery->capacity, 87);
    EXPECT_EQ(battery->status, "Discharging");
    EXPECT_FALSE(battery->charging());
    std::filesystem::remove_all(root);
}

TEST(Battery, MissingSupplyIsNullopt) {
    const auto root = statuskit::testing::make_temp_dir("sys");

    EXPECT_EQ(statuskit::read_battery(root), std::nullopt);
    std::filesystem::remove_all(root);
}

TEST(Battery, FullCountsAsCharging) {
    const statuskit::BatteryStatus status{.capacity = 100, .status = "Full"};

    EXPECT_TRUE(status.charging());
}

TEST(Disk, ReadsRootFilesystem) {
    const auto usage = statuskit::read_disk_usage("/");

    ASSERT_TRUE(usage.has_value());
    EXPECT_GT(usage->total_bytes, 0u);
    EXPECT_GE(usage->percent, 0);
    EXPECT_LE(usage->percent, 100);
    EXPECT_EQ(statuskit::read_disk_usage("/definitely/not/a/mount"), std::nullopt);
}

TEST(Disk, LabelsMounts) {
    EXPECT_EQ(statuskit::mount_label("/"), "root");
    EXPECT_EQ(statuskit::mount_label("/home"), "home");
    EXPECT_EQ(statuskit::mount_label("/boot/efi"), "boot");
    EXPECT_EQ(statuskit::mount_label("/mnt/data/"), "data");
}
