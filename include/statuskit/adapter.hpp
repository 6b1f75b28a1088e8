#ifndef STATUSKIT_ADAPTER_HPP
#define STATUSKIT_ADAPTER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

#include "statuskit/color.hpp"
#include "statuskit/compositor.hpp"
#include "statuskit/notifications.hpp"
#include "statuskit/widget.hpp"
#include "statuskit/widget_list.hpp"

namespace statuskit {

    inline constexpr std::string_view kDefaultAccent     = "secondary";
    inline constexpr std::string_view kDefaultAccentIcon = "active";

    std::string external_cache_key(std::string_view content);

    // Runs one widget through produce, severity and color resolution and
    // turns the result into a Segment. std::nullopt means the widget is not
    // shown this render. Exceptions from widget code are logged and treated
    // as a hidden widget.
    class WidgetAdapter {
      public:
        WidgetAdapter(WidgetContext& context, const ColorResolver& colors, Notifier& notifier);

        std::optional<Segment> build(Widget& widget, const InternalEntry& entry);
        std::optional<Segment> build(const ExternalEntry& entry);

        // Literal text, "#(cmd)", "$(cmd)" or a string with #{format}
        // expansions. Failures produce an empty string.
        std::string            evaluate_content(std::string_view content);

      private:
        std::optional<Segment>          build_internal(Widget& widget, const InternalEntry& entry);
        std::optional<Segment>          build_external(const ExternalEntry& entry);
        bool                            dependencies_met(Widget& widget);
        std::string                     run_shell(std::string_view command);
        std::string                     expand_format(std::string_view text);
        Segment                         colorize(std::string name, std::string content, std::string icon, std::string_view accent, std::string_view accent_icon, bool has_threshold) const;

        WidgetContext&                  context_;
        const ColorResolver&            colors_;
        Notifier&                       notifier_;
        std::unordered_set<std::string> notified_;
    };

} // namespace statuskit

#endif // STATUSKIT_ADAPTER_HPP
