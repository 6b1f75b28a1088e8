#ifndef STATUSKIT_RENDER_HPP
#define STATUSKIT_RENDER_HPP

#include <string>
#include <string_view>

#include "statuskit/cache.hpp"
#include "statuskit/color.hpp"
#include "statuskit/command_runner.hpp"
#include "statuskit/compositor.hpp"
#include "statuskit/config.hpp"
#include "statuskit/notifications.hpp"
#include "statuskit/option_source.hpp"
#include "statuskit/paths.hpp"
#include "statuskit/tmux.hpp"
#include "statuskit/widgets.hpp"

namespace statuskit {

    // Everything one render needs. References must outlive the render.
    struct RenderEnvironment {
        Config               config;
        Paths                paths;
        const OptionSource&  host;
        CacheStore&          cache;
        CommandRunner&       runner;
        TmuxClient&          tmux;
        Notifier&            notifier;
        const WidgetCatalog& catalog;
        Clock                clock = system_clock_seconds;
    };

    // theme_file when set, otherwise <themes_dir>/<theme>.json, otherwise the
    // built-in palette.
    Palette       load_theme(const Config& config, const Paths& paths);
    RenderOptions render_options_from(const Config& config, const ColorResolver& colors);

    // Never fails: widgets that error out or hide themselves are left out and
    // an empty list renders as an empty string.
    std::string   render_status(std::string_view widget_list, RenderEnvironment& environment);

    // Creates every catalog widget and lets it declare its options.
    void          declare_catalog_options(const WidgetCatalog& catalog, OptionRegistry& registry);

} // namespace statuskit

#endif // STATUSKIT_RENDER_HPP
