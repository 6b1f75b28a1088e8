#include "statuskit/widgets.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <ctime>
#include <thread>
#include <utility>

#include <unistd.h>

#include "statuskit/file_io.hpp"
#include "statuskit/logging.hpp"
#include "statuskit/strings.hpp"
#include "statuskit/system_stats.hpp"

namespace statuskit {

    namespace {

        std::string cached(WidgetContext& context, std::string_view widget, const std::function<std::string()>& compute) {
            const auto ttl = context.options.resolve_int(widget, "cache_ttl").value_or(0);
            if (ttl <= 0) {
                return compute();
            }
            return context.cache.get_or_compute(widget, ttl, compute);
        }

        std::string padded_percent(int64_t percent) {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%3lld%%", static_cast<long long>(percent));
            return buffer;
        }

        std::optional<std::string> read_proc(const WidgetContext& context, std::string_view name) {
            return read_file_contents(context.paths.proc_root / name);
        }

        std::optional<MemoryInfo> read_memory(const WidgetContext& context) {
            const auto text = read_proc(context, "meminfo");
            if (!text) {
                return std::nullopt;
            }
            return parse_meminfo(*text);
        }

        class CpuWidget final : public Widget, public DisplayInfoProvider {
          public:
            explicit CpuWidget(std::chrono::milliseconds sample_interval) : sample_interval_(sample_interval) {}

            std::string_view name() const override {
                return "cpu";
            }
            WidgetType type() const override {
                return WidgetType::kConditional;
            }
            void declare_options(OptionRegistry& registry) const override {
                declare_common_options(registry, name(), "\uF4BC", "5");
                declare_threshold_options(registry, name(), ThresholdMode::kNormal, 70, 90);
            }
            std::string produce(WidgetContext& context) override {
                return cached(context, name(), [&]() -> std::string {
                    const auto first = sample(context);
                    if (!first) {
                        return "N/A";
                    }
                    if (sample_interval_.count() > 0) {
                        std::this_thread::sleep_for(sample_interval_);
                    }
                    const auto second = sample(context);
                    if (!second) {
                        return "N/A";
                    }
                    return padded_percent(cpu_usage_percent(*first, *second));
                });
            }
            DisplayInfo display_info(std::string_view content, WidgetContext& context) override {
                return threshold_display_info(context.options, name(), content, extract_first_number(content));
            }

          private:
            static std::optional<CpuTimes> sample(const WidgetContext& context) {
                const auto text = read_proc(context, "stat");
                if (!text) {
                    return std::nullopt;
                }
                return parse_proc_stat(*text);
            }

            std::chrono::milliseconds sample_interval_;
        };

        class MemoryWidget final : public Widget, public DisplayInfoProvider {
          public:
            std::string_view name() const override {
                return "memory";
            }
            WidgetType type() const override {
                return WidgetType::kConditional;
            }
            void declare_options(OptionRegistry& registry) const override {
                registry.declare_option(name(), "format", OptionKind::kString, "percent", "Display format (percent, usage)");
                declare_common_options(registry, name(), "\uEFC5", "5");
                declare_threshold_options(registry, name(), ThresholdMode::kNormal, 80, 90);
            }
            std::string produce(WidgetContext& context) override {
                return cached(context, name(), [&]() -> std::string {
                    const auto memory = read_memory(context);
                    if (!memory) {
                        return "N/A";
                    }
                    if (context.options.resolve(name(), "format") == "usage") {
                        return bytes_to_human(memory->used_kb() * kBytesPerKb) + "/" + bytes_to_human(memory->total_kb * kBytesPerKb);
                    }
                    return padded_percent(static_cast<int64_t>(memory->used_kb() * 100 / memory->total_kb));
                });
            }
            // Severity follows the shown (possibly cached) value, not a fresh
            // read of /proc/meminfo.
            DisplayInfo display_info(std::string_view content, WidgetContext& context) override {
                return threshold_display_info(context.options, name(), content, percent_from_content(content));
            }

          private:
            static std::optional<int64_t> percent_from_content(std::string_view content) {
                const auto slash = content.find('/');
                if (slash == std::string_view::npos) {
                    return extract_first_number(content);
                }
                const auto used  = human_to_bytes(content.substr(0, slash));
                const auto total = human_to_bytes(content.substr(slash + 1));
                if (!used || !total || *total == 0) {
                    return std::nullopt;
                }
                return static_cast<int64_t>(*used * 100 / *total);
            }
        };

        class LoadavgWidget final : public Widget, public DisplayInfoProvider {
          public:
            std::string_view name() const override {
                return "loadavg";
            }
            void declare_options(OptionRegistry& registry) const override {
                registry.declare_option(name(), "format", OptionKind::kString, "1", "Load average shown (1, 5, 15, all)");
                registry.declare_option(name(), "warning_threshold_multiplier", OptionKind::kNumber, "2", "Warning threshold as a multiple of the CPU count");
                registry.declare_option(name(), "critical_threshold_multiplier", OptionKind::kNumber, "4", "Critical threshold as a multiple of the CPU count");
                declare_common_options(registry, name(), "\U000F199F", "10");
            }
            std::string produce(WidgetContext& context) override {
                return cached(context, name(), [&]() -> std::string {
                    const auto text = read_proc(context, "loadavg");
                    const auto load = text ? parse_loadavg(*text) : std::nullopt;
                    if (!load) {
                        return "N/A";
                    }
                    const auto format = context.options.resolve(name(), "format");
                    if (format == "1") {
                        return load->one;
                    }
                    if (format == "5") {
                        return load->five;
                    }
                    if (format == "15") {
                        return load->fifteen;
                    }
                    return load->one + " " + load->five + " " + load->fifteen;
                });
            }
            DisplayInfo display_info(std::string_view content, WidgetContext& context) override {
                const auto    value    = load_hundredths(split(trim_view(content), ' ').front()).value_or(0);
                const int64_t cores    = std::max<long>(1, ::sysconf(_SC_NPROCESSORS_ONLN));
                const auto    warning  = multiplier(context, "warning_threshold_multiplier", 2);
                const auto    critical = multiplier(context, "critical_threshold_multiplier", 4);
                const auto    level    = compute_severity(value, ThresholdConfig{.mode = ThresholdMode::kNormal, .warning = cores * warning * 100, .critical = cores * critical * 100});
                return severity_display_info(context.options, name(), content, level);
            }

          private:
            // Bounded so cores * multiplier * 100 stays within int64_t.
            static constexpr int64_t kMaxMultiplier = 1000;

            int64_t multiplier(WidgetContext& context, std::string_view option, int64_t fallback) const {
                return std::clamp<int64_t>(context.options.resolve_int(name(), option).value_or(fallback), 0, kMaxMultiplier);
            }
        };

        class UptimeWidget final : public Widget {
          public:
            std::string_view name() const override {
                return "uptime";
            }
            void declare_options(OptionRegistry& registry) const override {
                declare_common_options(registry, name(), "\uE382", "60");
            }
            std::string produce(WidgetContext& context) override {
                return cached(context, name(), [&]() -> std::string {
                    const auto text    = read_proc(context, "uptime");
                    const auto seconds = text ? parse_uptime_seconds(*text) : std::nullopt;
                    if (!seconds) {
                        return "N/A";
                    }
                    return format_uptime(*seconds);
                });
            }
        };

        class BatteryWidget final : public Widget, public DisplayInfoProvider {
          public:
            std::string_view name() const override {
                return "battery";
            }
            WidgetType type() const override {
                return WidgetType::kConditional;
            }
            void declare_options(OptionRegistry& registry) const override {
                registry.declare_option(name(), "hide_when_full_and_charging", OptionKind::kBool, "false", "Hide when at 100% and charging");
                registry.declare_option(name(), "icon_charging", OptionKind::kIcon, "\U000F0084", "Icon while charging");
                registry.declare_option(name(), "icon_low", OptionKind::kIcon, "\U000F0083", "Icon at or below the critical threshold");
                declare_common_options(registry, name(), "\U000F0079", "60");
                declare_threshold_options(registry, name(), ThresholdMode::kInverted, 50, 30);
            }
            // Content carries the charge state as a "charging:"/"discharging:"
            // prefix so it survives the cache; the adapter strips it.
            std::string produce(WidgetContext& context) override {
                return cached(context, name(), [&]() -> std::string {
                    const auto battery = read_battery(context.paths.sys_root);
                    if (!battery) {
                        return {};
                    }
                    if (battery->capacity == 100 && battery->charging() && context.options.resolve_bool(name(), "hide_when_full_and_charging")) {
                        return {};
                    }
                    return std::string(battery->charging() ? "charging:" : "discharging:") + std::to_string(battery->capacity) + "%";
                });
            }
            DisplayInfo display_info(std::string_view content, WidgetContext& context) override {
                const auto value = extract_first_number(content);
                auto       info  = threshold_display_info(context.options, name(), clean_content(content), value);
                if (!info.visible) {
                    return info;
                }
                const auto critical = context.options.resolve_int(name(), "critical_threshold");
                if (value && critical && *value <= *critical) {
                    info.icon = context.options.resolve(name(), "icon_low");
                }
                if (content.starts_with("charging:")) {
                    info.icon = context.options.resolve(name(), "icon_charging");
                }
                return info;
            }
        };

        class DiskWidget final : public Widget, public DisplayInfoProvider {
          public:
            std::string_view name() const override {
                return "disk";
            }
            WidgetType type() const override {
                return WidgetType::kConditional;
            }
            void declare_options(OptionRegistry& registry) const override {
                registry.declare_option(name(), "mounts", OptionKind::kString, "/", "Comma separated mount points");
                registry.declare_option(name(), "format", OptionKind::kString, "percent", "Display format (percent, usage, free)");
                registry.declare_option(name(), "separator", OptionKind::kString, " | ", "Separator between mount points");
                registry.declare_option(name(), "show_label", OptionKind::kBool, "true", "Prefix each value with the mount label");
                declare_common_options(registry, name(), "\U000F02CA", "120");
                declare_threshold_options(registry, name(), ThresholdMode::kNormal, 70, 90);
            }
            std::string produce(WidgetContext& context) override {
                return cached(context, name(), [&]() -> std::string {
                    const auto  format     = context.options.resolve(name(), "format");
                    const auto  separator  = context.options.resolve(name(), "separator");
                    const bool  show_label = context.options.resolve_bool(name(), "show_label");
                    std::string out;
                    for (const auto& mount : mounts(context)) {
                        const auto usage = read_disk_usage(mount);
                        if (!usage) {
                            continue;
                        }
                        if (!out.empty()) {
                            out += separator;
                        }
                        if (show_label) {
                            out += mount_label(mount) + " ";
                        }
                        if (format == "usage") {
                            out += bytes_to_human(usage->used_bytes) + "/" + bytes_to_human(usage->total_bytes);
                        } else if (format == "free") {
                            out += bytes_to_human(usage->free_bytes);
                        } else {
                            out += padded_percent(usage->percent);
                        }
                    }
                    return out;
                });
            }
            // The fullest mount drives the severity.
            DisplayInfo display_info(std::string_view content, WidgetContext& context) override {
                std::optional<int64_t> fullest;
                for (const auto& mount : mounts(context)) {
                    if (const auto usage = read_disk_usage(mount)) {
                        fullest = std::max<int64_t>(fullest.value_or(0), usage->percent);
                    }
                }
                return threshold_display_info(context.options, name(), content, fullest);
            }

          private:
            std::vector<std::string> mounts(WidgetContext& context) const {
                std::vector<std::string> out;
                for (const auto& mount : split(context.options.resolve(name(), "mounts"), ',')) {
                    if (auto trimmed = trim_copy(mount); !trimmed.empty()) {
                        out.push_back(std::move(trimmed));
                    }
                }
                return out;
            }
        };

        class HostnameWidget final : public Widget, public DependencyProvider {
          public:
            std::string_view name() const override {
                return "hostname";
            }
            void declare_options(OptionRegistry& registry) const override {
                registry.declare_option(name(), "format", OptionKind::kString, "short", "Hostname format (short, full)");
                declare_common_options(registry, name(), "\U000F0379", "0");
            }
            std::vector<std::string> missing_dependencies(WidgetContext& context) const override {
                if (context.options.resolve(name(), "format") == "full" && !command_exists("hostname")) {
                    return {"hostname"};
                }
                return {};
            }
            std::string produce(WidgetContext& context) override {
                if (context.options.resolve(name(), "format") == "full") {
                    const auto result = context.runner.run({"hostname", "-f"}, context.command_timeout);
                    if (result && result->ok()) {
                        if (auto full = strip_trailing_newlines(result->output); !full.empty()) {
                            return full;
                        }
                    }
                    debug_log("hostname", "hostname -f failed, using the kernel hostname");
                    return local_hostname();
                }
                auto host = local_hostname();
                return host.substr(0, host.find('.'));
            }

          private:
            static std::string local_hostname() {
                std::array<char, 256> buffer{};
                if (::gethostname(buffer.data(), buffer.size() - 1) != 0) {
                    return {};
                }
                return std::string(buffer.data());
            }
        };

        class DatetimeWidget final : public Widget {
          public:
            std::string_view name() const override {
                return "datetime";
            }
            void declare_options(OptionRegistry& registry) const override {
                registry.declare_option(name(), "format", OptionKind::kString, "datetime", "Preset (time, date, datetime, full, iso, ...) or a strftime pattern");
                registry.declare_option(name(), "show_week", OptionKind::kBool, "false", "Prefix the ISO week number");
                registry.declare_option(name(), "separator", OptionKind::kString, " ", "Separator between elements");
                declare_common_options(registry, name(), "\U000F0954", "0");
            }
            std::string produce(WidgetContext& context) override {
                const auto now       = context.clock();
                auto       separator = context.options.resolve(name(), "separator");
                if (separator.empty()) {
                    separator = " ";
                }
                std::string out;
                if (context.options.resolve_bool(name(), "show_week")) {
                    out = format_local_time(now, "W%V") + separator;
                }
                out += format_local_time(now, resolve_datetime_format(context.options.resolve(name(), "format")));
                return out;
            }
        };

    } // namespace

    WidgetCatalog WidgetCatalog::builtin() {
        WidgetCatalog catalog;
        catalog.add("cpu", [] { return make_cpu_widget(); });
        catalog.add("memory", make_memory_widget);
        catalog.add("loadavg", make_loadavg_widget);
        catalog.add("uptime", make_uptime_widget);
        catalog.add("battery", make_battery_widget);
        catalog.add("disk", make_disk_widget);
        catalog.add("hostname", make_hostname_widget);
        catalog.add("datetime", make_datetime_widget);
        return catalog;
    }

    void WidgetCatalog::add(std::string name, WidgetFactory factory) {
        factories_[std::move(name)] = std::move(factory);
    }

    std::unique_ptr<Widget> WidgetCatalog::create(std::string_view name) const {
        const auto it = factories_.find(name);
        if (it == factories_.end()) {
            return nullptr;
        }
        return it->second();
    }

    bool WidgetCatalog::contains(std::string_view name) const {
        return factories_.find(name) != factories_.end();
    }

    std::vector<std::string> WidgetCatalog::names() const {
        std::vector<std::string> names;
        names.reserve(factories_.size());
        for (const auto& [name, factory] : factories_) {
            names.push_back(name);
        }
        return names;
    }

    std::unique_ptr<Widget> make_cpu_widget(std::chrono::milliseconds sample_interval) {
        return std::make_unique<CpuWidget>(sample_interval);
    }

    std::unique_ptr<Widget> make_memory_widget() {
        return std::make_unique<MemoryWidget>();
    }

    std::unique_ptr<Widget> make_loadavg_widget() {
        return std::make_unique<LoadavgWidget>();
    }

    std::unique_ptr<Widget> make_uptime_widget() {
        return std::make_unique<UptimeWidget>();
    }

    std::unique_ptr<Widget> make_battery_widget() {
        return std::make_unique<BatteryWidget>();
    }

    std::unique_ptr<Widget> make_disk_widget() {
        return std::make_unique<DiskWidget>();
    }

    std::unique_ptr<Widget> make_hostname_widget() {
        return std::make_unique<HostnameWidget>();
    }

    std::unique_ptr<Widget> make_datetime_widget() {
        return std::make_unique<DatetimeWidget>();
    }

    std::string resolve_datetime_format(std::string_view format) {
        static constexpr std::array<std::pair<std::string_view, std::string_view>, 16> kPresets = {{
            {"time", "%H:%M"},
            {"time-seconds", "%H:%M:%S"},
            {"time-12h", "%I:%M %p"},
            {"time-12h-seconds", "%I:%M:%S %p"},
            {"date", "%d/%m"},
            {"date-us", "%m/%d"},
            {"date-full", "%d/%m/%Y"},
            {"date-full-us", "%m/%d/%Y"},
            {"date-iso", "%Y-%m-%d"},
            {"datetime", "%d/%m %H:%M"},
            {"datetime-us", "%m/%d %I:%M %p"},
            {"weekday", "%a %H:%M"},
            {"weekday-full", "%A %H:%M"},
            {"full", "%a, %d %b %H:%M"},
            {"full-date", "%a, %d %b %Y"},
            {"iso", "%Y-%m-%dT%H:%M:%S"},
        }};
        for (const auto& [preset, pattern] : kPresets) {
            if (preset == format) {
                return std::string(pattern);
            }
        }
        return std::string(format);
    }

    std::string format_local_time(int64_t epoch_seconds, std::string_view pattern) {
        if (pattern.empty()) {
            return {};
        }
        const std::time_t time = static_cast<std::time_t>(epoch_seconds);
        std::tm           local{};
        if (::localtime_r(&time, &local) == nullptr) {
            return {};
        }
        std::array<char, 256> buffer{};
        const auto            written = std::strftime(buffer.data(), buffer.size(), std::string(pattern).c_str(), &local);
        return std::string(buffer.data(), written);
    }

} // namespace statuskit
