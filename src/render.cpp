#include "statuskit/render.hpp"

#include <variant>
#include <vector>

#include "statuskit/adapter.hpp"
#include "statuskit/failsafe.hpp"
#include "statuskit/logging.hpp"
#include "statuskit/widget_list.hpp"

namespace statuskit {

    namespace {

        template <class... Ts>
        struct Overloaded : Ts... {
            using Ts::operator()...;
        };

        void log_render_error(std::string_view context, std::string_view message) {
            error_log(context, message);
        }

        bool declare_widget_options(const Widget& widget, OptionRegistry& registry) {
            return failsafe::guard([&] { widget.declare_options(registry); }, log_render_error, "declare options");
        }

    } // namespace

    Palette load_theme(const Config& config, const Paths& paths) {
        std::filesystem::path path;
        if (config.theme_file) {
            path = *config.theme_file;
        } else {
            path = paths.themes_dir / (config.theme + ".json");
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) {
                return default_palette();
            }
        }
        auto palette = load_palette_file(path);
        if (!palette) {
            error_log("theme", palette.error());
            return default_palette();
        }
        return std::move(*palette);
    }

    RenderOptions render_options_from(const Config& config, const ColorResolver& colors) {
        RenderOptions options;
        options.status_bg              = colors.resolve(config.status_bg);
        options.transparent            = config.transparent;
        options.separator_style        = config.separator_style;
        options.spacing                = config.spacing;
        options.text_color             = colors.resolve(config.text_color);
        options.spacing_bg             = colors.resolve("surface");
        options.spacing_fg_transparent = colors.resolve("background");
        if (options.text_color.empty()) {
            options.text_color = colors.resolve("white");
        }
        return options;
    }

    void declare_catalog_options(const WidgetCatalog& catalog, OptionRegistry& registry) {
        for (const auto& name : catalog.names()) {
            if (const auto widget = catalog.create(name)) {
                (void)declare_widget_options(*widget, registry);
            }
        }
    }

    std::string render_status(std::string_view widget_list, RenderEnvironment& environment) {
        const auto entries = parse_widget_list(widget_list);
        if (entries.empty()) {
            return {};
        }

        const ColorResolver colors(load_theme(environment.config, environment.paths));
        OptionRegistry      registry(environment.host);
        WidgetContext       context{
                  .options         = registry,
                  .cache           = environment.cache,
                  .runner          = environment.runner,
                  .tmux            = environment.tmux,
                  .paths           = environment.paths,
                  .clock           = environment.clock,
                  .command_timeout = std::chrono::milliseconds(environment.config.command_timeout_ms),
        };
        WidgetAdapter adapter(context, colors, environment.notifier);

        std::vector<Segment> segments;
        segments.reserve(entries.size());
        for (const auto& entry : entries) {
            auto segment = std::visit(Overloaded{
                                          [&](const InternalEntry& internal) -> std::optional<Segment> {
                                              auto widget = environment.catalog.create(internal.name);
                                              if (!widget) {
                                                  debug_log("render", "unknown widget " + internal.name);
                                                  return std::nullopt;
                                              }
                                              if (!declare_widget_options(*widget, registry)) {
                                                  return std::nullopt;
                                              }
                                              return adapter.build(*widget, internal);
                                          },
                                          [&](const ExternalEntry& external) -> std::optional<Segment> { return adapter.build(external); },
                                      },
                                      entry);
            if (segment) {
                segments.push_back(std::move(*segment));
            }
        }

        debug_log("render", std::to_string(segments.size()) + " of " + std::to_string(entries.size()) + " widgets shown");
        return render_segments(segments, render_options_from(environment.config, colors));
    }

} // namespace statuskit
