#include "statuskit/system_stats.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <sstream>
#include <system_error>
#include <vector>

#include <sys/statvfs.h>

#include "statuskit/file_io.hpp"
#include "statuskit/strings.hpp"

namespace statuskit {

    namespace {

        std::vector<std::string> fields(std::string_view line) {
            std::vector<std::string> out;
            std::istringstream       stream{std::string(line)};
            std::string              token;
            while (stream >> token) {
                out.push_back(token);
            }
            return out;
        }

        std::optional<uint64_t> parse_unsigned(std::string_view text) {
            const auto parsed = parse_int(text);
            if (!parsed || *parsed < 0) {
                return std::nullopt;
            }
            return static_cast<uint64_t>(*parsed);
        }

        std::string format_fixed(double value, std::string_view suffix) {
            char buffer[64];
            std::snprintf(buffer, sizeof(buffer), "%.1f", value);
            return std::string(buffer) + std::string(suffix);
        }

    } // namespace

    std::optional<CpuTimes> parse_proc_stat(std::string_view text) {
        for (const auto& line : split(text, '\n')) {
            if (!line.starts_with("cpu ")) {
                continue;
            }
            const auto parts = fields(line);
            if (parts.size() < 5) {
                return std::nullopt;
            }
            CpuTimes times;
            for (size_t i = 1; i < parts.size(); ++i) {
                const auto value = parse_unsigned(parts[i]);
                if (!value) {
                    return std::nullopt;
                }
                times.total += *value;
                if (i == 4 || i == 5) {
                    times.idle += *value;
                }
            }
            return times;
        }
        return std::nullopt;
    }

    int cpu_usage_percent(const CpuTimes& before, const CpuTimes& after) {
        if (after.total <= before.total) {
            return 0;
        }
        const uint64_t delta_total = after.total - before.total;
        const uint64_t delta_idle  = after.idle >= before.idle ? after.idle - before.idle : 0;
        if (delta_idle >= delta_total) {
            return 0;
        }
        return static_cast<int>((1000 * (delta_total - delta_idle) / delta_total + 5) / 10);
    }

    std::optional<MemoryInfo> parse_meminfo(std::string_view text) {
        std::optional<uint64_t> total;
        std::optional<uint64_t> available;
        uint64_t                free    = 0;
        uint64_t                buffers = 0;
        uint64_t                cached  = 0;
        for (const auto& line : split(text, '\n')) {
            const auto parts = fields(line);
            if (parts.size() < 2) {
                continue;
            }
            const auto value = parse_unsigned(parts[1]);
            if (!value) {
                continue;
            }
            if (parts[0] == "MemTotal:") {
                total = value;
            } else if (parts[0] == "MemAvailable:") {
                available = value;
            } else if (parts[0] == "MemFree:") {
                free = *value;
            } else if (parts[0] == "Buffers:") {
                buffers = *value;
            } else if (parts[0] == "Cached:") {
                cached = *value;
            }
        }
        if (!total || *total == 0) {
            return std::nullopt;
        }
        return MemoryInfo{.total_kb = *total, .available_kb = available.value_or(free + buffers + cached)};
    }

    std::optional<LoadAverage> parse_loadavg(std::string_view text) {
        const auto parts = fields(text);
        if (parts.size() < 3) {
            return std::nullopt;
        }
        return LoadAverage{parts[0], parts[1], parts[2]};
    }

    std::optional<int64_t> load_hundredths(std::string_view text) {
        text             = trim_view(text);
        const auto dot   = text.find('.');
        const auto whole = parse_int(text.substr(0, dot));
        if (!whole || *whole < 0) {
            return std::nullopt;
        }
        int64_t fraction = 0;
        if (dot != std::string_view::npos) {
            auto digits = text.substr(dot + 1, 2);
            if (!digits.empty()) {
                const auto parsed = parse_int(digits);
                if (!parsed || *parsed < 0) {
                    return std::nullopt;
                }
                fraction = digits.size() == 1 ? *parsed * 10 : *parsed;
            }
        }
        return *whole * 100 + fraction;
    }

    std::optional<int64_t> parse_uptime_seconds(std::string_view text) {
        const auto parts = fields(text);
        if (parts.empty()) {
            return std::nullopt;
        }
        return parse_int(std::string_view(parts[0]).substr(0, parts[0].find('.')));
    }

    std::string format_uptime(int64_t seconds) {
        if (seconds < 0) {
            seconds = 0;
        }
        const int64_t days    = seconds / 86400;
        const int64_t hours   = (seconds % 86400) / 3600;
        const int64_t minutes = (seconds % 3600) / 60;
        if (days > 0) {
            return std::to_string(days) + "d " + std::to_string(hours) + "h";
        }
        if (hours > 0) {
            return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
        }
        return std::to_string(minutes) + "m";
    }

    std::string bytes_to_human(uint64_t bytes) {
        if (bytes >= kBytesPerGb) {
            return format_fixed(static_cast<double>(bytes) / static_cast<double>(kBytesPerGb), "G");
        }
        return std::to_string(bytes / kBytesPerMb) + "M";
    }

    std::optional<uint64_t> human_to_bytes(std::string_view text) {
        text = trim_view(text);
        if (text.size() < 2) {
            return std::nullopt;
        }
        uint64_t unit = 0;
        switch (text.back()) {
            case 'K': unit = kBytesPerKb; break;
            case 'M': unit = kBytesPerMb; break;
            case 'G': unit = kBytesPerGb; break;
            case 'T': unit = kBytesPerTb; break;
            default: return std::nullopt;
        }
        text.remove_suffix(1);
        double     value  = 0;
        const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec != std::errc{} || result.ptr != text.data() + text.size() || value < 0 || value > 1e6) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(value * static_cast<double>(unit));
    }

    bool BatteryStatus::charging() const {
        const auto normalized = to_lower_copy(status);
        return normalized == "charging" || normalized == "full";
    }

    std::optional<BatteryStatus> read_battery(const std::filesystem::path& sys_root) {
        const auto      supplies = sys_root / "class" / "power_supply";
        std::error_code ec;
        std::vector<std::filesystem::path> candidates;
        for (auto it = std::filesystem::directory_iterator(supplies, ec); !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            candidates.push_back(it->path());
        }
        std::sort(candidates.begin(), candidates.end());
        for (const auto& supply : candidates) {
            const auto type = read_file_contents(supply / "type");
            if (!type || trim_view(*type) != "Battery") {
                continue;
            }
            const auto capacity = read_file_contents(supply / "capacity");
            if (!capacity) {
                continue;
            }
            const auto parsed = parse_int(trim_view(*capacity));
            if (!parsed) {
                continue;
            }
            BatteryStatus status;
            status.capacity = static_cast<int>(std::clamp<int64_t>(*parsed, 0, 100));
            if (const auto state = read_file_contents(supply / "status")) {
                status.status = trim_copy(*state);
            }
            return status;
        }
        return std::nullopt;
    }

    std::optional<DiskUsage> read_disk_usage(const std::filesystem::path& mount) {
        struct statvfs info {};
        if (::statvfs(mount.c_str(), &info) != 0 || info.f_blocks == 0) {
            return std::nullopt;
        }
        const uint64_t block = info.f_frsize != 0 ? info.f_frsize : info.f_bsize;
        DiskUsage      usage;
        usage.total_bytes       = static_cast<uint64_t>(info.f_blocks) * block;
        usage.free_bytes        = static_cast<uint64_t>(info.f_bavail) * block;
        usage.used_bytes        = static_cast<uint64_t>(info.f_blocks - info.f_bfree) * block;
        const uint64_t usable   = usage.used_bytes + usage.free_bytes;
        usage.percent           = usable == 0 ? 0 : static_cast<int>((usage.used_bytes * 100 + usable - 1) / usable);
        return usage;
    }

    std::string mount_label(std::string_view mount) {
        if (mount == "/") {
            return "root";
        }
        if (mount == "/home" || mount.starts_with("/Users/")) {
            return "home";
        }
        if (mount == "/boot" || mount.starts_with("/boot/")) {
            return "boot";
        }
        while (mount.size() > 1 && mount.back() == '/') {
            mount.remove_suffix(1);
        }
        const auto slash = mount.find_last_of('/');
        return std::string(slash == std::string_view::npos ? mount : mount.substr(slash + 1));
    }

} // namespace statuskit
