#ifndef STATUSKIT_SYSTEM_STATS_HPP
#define STATUSKIT_SYSTEM_STATS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace statuskit {

    inline constexpr uint64_t kBytesPerKb = 1024;
    inline constexpr uint64_t kBytesPerMb = 1024 * kBytesPerKb;
    inline constexpr uint64_t kBytesPerGb = 1024 * kBytesPerMb;
    inline constexpr uint64_t kBytesPerTb = 1024 * kBytesPerGb;

    struct CpuTimes {
        uint64_t idle  = 0;
        uint64_t total = 0;
    };

    // Aggregate "cpu " line of /proc/stat. idle includes iowait.
    std::optional<CpuTimes> parse_proc_stat(std::string_view text);
    int                     cpu_usage_percent(const CpuTimes& before, const CpuTimes& after);

    struct MemoryInfo {
        uint64_t total_kb     = 0;
        uint64_t available_kb = 0;

        uint64_t used_kb() const {
            return total_kb > available_kb ? total_kb - available_kb : 0;
        }
    };

    // Falls back to MemFree + Buffers + Cached on kernels without
    // MemAvailable.
    std::optional<MemoryInfo> parse_meminfo(std::string_view text);

    struct LoadAverage {
        std::string one;
        std::string five;
        std::string fifteen;
    };

    std::optional<LoadAverage> parse_loadavg(std::string_view text);
    // Load value scaled by 100, "1.25" -> 125.
    std::optional<int64_t>     load_hundredths(std::string_view text);

    std::optional<int64_t>     parse_uptime_seconds(std::string_view text);
    std::string                format_uptime(int64_t seconds);

    // "1.5G" at or above one GiB, "512M" below.
    std::string                bytes_to_human(uint64_t bytes);
    // Inverse of bytes_to_human for K, M, G and T suffixes.
    std::optional<uint64_t>    human_to_bytes(std::string_view text);

    struct BatteryStatus {
        int         capacity = 0;
        std::string status;

        bool charging() const;
    };

    // First power supply under <sys_root>/class/power_supply whose type is
    // Battery.
    std::optional<BatteryStatus> read_battery(const std::filesystem::path& sys_root);

    struct DiskUsage {
        uint64_t total_bytes = 0;
        uint64_t used_bytes  = 0;
        uint64_t free_bytes  = 0;
        int      percent     = 0;
    };

    std::optional<DiskUsage> read_disk_usage(const std::filesystem::path& mount);
    std::string              mount_label(std::string_view mount);

} // namespace statuskit

#endif // STATUSKIT_SYSTEM_STATS_HPP
