#ifndef STATUSKIT_OPTIONS_HPP
#define STATUSKIT_OPTIONS_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "statuskit/option_source.hpp"

namespace statuskit {

    enum class OptionKind {
        kString,
        kNumber,
        kBool,
        kColor,
        kIcon,
        kKey,
        kPath,
    };

    std::string_view          option_kind_name(OptionKind kind);
    std::optional<OptionKind> parse_option_kind(std::string_view value);

    struct OptionDescriptor {
        std::string name;
        OptionKind  kind = OptionKind::kString;
        std::string default_value;
        std::string description;
    };

    inline constexpr std::string_view kHostOptionPrefix = "@statuskit_widget_";

    // "@statuskit_widget_<widget>_<name>", the tmux option that overrides a
    // widget setting.
    std::string host_option_name(std::string_view widget, std::string_view name);

    // Last-resort defaults keyed by widget and option name. The widget "*"
    // applies to every widget.
    class FallbackDefaults {
      public:
        static constexpr std::string_view kAnyWidget = "*";

        static FallbackDefaults builtin();

        void                       set(std::string_view widget, std::string_view name, std::string value);
        std::optional<std::string> get(std::string_view widget, std::string_view name) const;

      private:
        std::map<std::string, std::string, std::less<>> values_;
    };

    // Options every widget understands without declaring them.
    const std::vector<OptionDescriptor>& standard_options();

    // Typed per-widget settings with fixed-precedence lazy resolution. A
    // resolved value is memoized and stays fixed for the life of the
    // registry unless clear_cache is called.
    class OptionRegistry {
      public:
        explicit OptionRegistry(const OptionSource& host, FallbackDefaults fallbacks = FallbackDefaults::builtin());

        void                          declare_option(std::string_view widget, OptionDescriptor descriptor);
        void                          declare_option(std::string_view widget, std::string_view name, OptionKind kind, std::string_view default_value, std::string_view description);

        std::string                   resolve(std::string_view widget, std::string_view name);
        std::optional<int64_t>        resolve_int(std::string_view widget, std::string_view name);
        bool                          resolve_bool(std::string_view widget, std::string_view name);

        void                          clear_cache();
        void                          clear_cache(std::string_view widget);
        std::size_t                   memoized_count() const;

        const OptionDescriptor*       find(std::string_view widget, std::string_view name) const;
        std::vector<OptionDescriptor> declared_options(std::string_view widget) const;
        std::vector<std::string>      declared_widgets() const;

      private:
        std::string                                                           resolve_uncached(std::string_view widget, std::string_view name) const;

        const OptionSource&                                                   host_;
        FallbackDefaults                                                      fallbacks_;
        std::map<std::string, std::vector<OptionDescriptor>, std::less<>>     declarations_;
        std::unordered_map<std::string, std::string>                          memo_;
    };

    // Options viewer output. An empty widget filter lists every declared
    // widget.
    std::string render_options_text(OptionRegistry& registry, std::string_view widget_filter = {});
    std::string render_options_json(OptionRegistry& registry, std::string_view widget_filter = {});

} // namespace statuskit

#endif // STATUSKIT_OPTIONS_HPP
