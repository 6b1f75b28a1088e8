#ifndef STATUSKIT_WIDGETS_HPP
#define STATUSKIT_WIDGETS_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "statuskit/widget.hpp"

namespace statuskit {

    using WidgetFactory = std::function<std::unique_ptr<Widget>()>;

    class WidgetCatalog {
      public:
        // cpu, memory, loadavg, uptime, battery, disk, hostname, datetime.
        static WidgetCatalog builtin();

        void                     add(std::string name, WidgetFactory factory);
        std::unique_ptr<Widget>  create(std::string_view name) const;
        bool                     contains(std::string_view name) const;
        std::vector<std::string> names() const;

      private:
        std::map<std::string, WidgetFactory, std::less<>> factories_;
    };

    inline constexpr std::chrono::milliseconds kCpuSampleInterval{100};

    std::unique_ptr<Widget> make_cpu_widget(std::chrono::milliseconds sample_interval = kCpuSampleInterval);
    std::unique_ptr<Widget> make_memory_widget();
    std::unique_ptr<Widget> make_loadavg_widget();
    std::unique_ptr<Widget> make_uptime_widget();
    std::unique_ptr<Widget> make_battery_widget();
    std::unique_ptr<Widget> make_disk_widget();
    std::unique_ptr<Widget> make_hostname_widget();
    std::unique_ptr<Widget> make_datetime_widget();

    // Named presets ("time", "date-iso", ...) map to strftime patterns; any
    // other value is used as a pattern as-is.
    std::string resolve_datetime_format(std::string_view format);
    std::string format_local_time(int64_t epoch_seconds, std::string_view pattern);

} // namespace statuskit

#endif // STATUSKIT_WIDGETS_HPP
