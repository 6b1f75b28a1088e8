#ifndef STATUSKIT_WIDGET_HPP
#define STATUSKIT_WIDGET_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "statuskit/cache.hpp"
#include "statuskit/command_runner.hpp"
#include "statuskit/options.hpp"
#include "statuskit/paths.hpp"
#include "statuskit/severity.hpp"
#include "statuskit/tmux.hpp"

namespace statuskit {

    enum class WidgetType {
        kStatic,
        kConditional,
    };

    // "dynamic" is accepted as an older spelling of "conditional".
    std::optional<WidgetType> parse_widget_type(std::string_view value);

    struct WidgetContext {
        OptionRegistry&           options;
        CacheStore&               cache;
        CommandRunner&            runner;
        TmuxClient&               tmux;
        const Paths&              paths;
        Clock                     clock           = system_clock_seconds;
        std::chrono::milliseconds command_timeout = kDefaultCommandTimeout;
    };

    // Empty fields keep the registry defaults.
    struct DisplayInfo {
        bool        visible = true;
        std::string accent;
        std::string accent_icon;
        std::string icon;
    };

    class Widget {
      public:
        virtual ~Widget() = default;

        virtual std::string_view name() const = 0;
        virtual WidgetType       type() const {
            return WidgetType::kStatic;
        }
        virtual void declare_options(OptionRegistry& registry) const = 0;

        // An empty result suppresses the widget for this render.
        virtual std::string produce(WidgetContext& context) = 0;
    };

    class DisplayInfoProvider {
      public:
        virtual ~DisplayInfoProvider()                                                           = default;
        virtual DisplayInfo display_info(std::string_view content, WidgetContext& context) = 0;
    };

    class DependencyProvider {
      public:
        virtual ~DependencyProvider()                                                              = default;
        virtual std::vector<std::string> missing_dependencies(WidgetContext& context) const = 0;
    };

    // icon, accent_color, accent_color_icon and cache_ttl.
    void declare_common_options(OptionRegistry& registry, std::string_view widget, std::string_view icon, std::string_view cache_ttl);
    // threshold_mode, warning_threshold, critical_threshold, show_only_warning.
    void declare_threshold_options(OptionRegistry& registry, std::string_view widget, ThresholdMode mode, int64_t warning, int64_t critical);

    ThresholdConfig threshold_config_from_options(OptionRegistry& registry, std::string_view widget);
    VisibilityRule  visibility_rule_from_options(OptionRegistry& registry, std::string_view widget);

    // Numeric threshold path: severity from value, then visibility, then the
    // severity color pair. Content that is empty or "N/A" hides the widget.
    DisplayInfo threshold_display_info(OptionRegistry& registry, std::string_view widget, std::string_view content, std::optional<int64_t> value);

    // For widgets that set their severity directly.
    DisplayInfo severity_display_info(OptionRegistry& registry, std::string_view widget, std::string_view content, SeverityLevel level);

    // Drops a leading "<word>:" status prefix and a "MODIFIED:" marker.
    std::string clean_content(std::string_view content);

} // namespace statuskit

#endif // STATUSKIT_WIDGET_HPP
