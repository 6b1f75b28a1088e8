#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "statuskit/cache.hpp"
#include "statuskit/color.hpp"
#include "statuskit/command.hpp"
#include "statuskit/command_runner.hpp"
#include "statuskit/config.hpp"
#include "statuskit/failsafe.hpp"
#include "statuskit/logging.hpp"
#include "statuskit/notifications.hpp"
#include "statuskit/options.hpp"
#include "statuskit/paths.hpp"
#include "statuskit/render.hpp"
#include "statuskit/tmux.hpp"
#include "statuskit/version.hpp"
#include "statuskit/widgets.hpp"

namespace {

    // stdout belongs to tmux, so log lines go to a file under the cache dir.
    std::filesystem::path g_log_path;

    void append_log_line(std::string_view message) {
        if (g_log_path.empty()) {
            return;
        }
        std::ofstream out(g_log_path, std::ios::app);
        if (out) {
            out << message << '\n';
        }
    }

    void debug_log_sink(std::string_view message) {
        append_log_line(message);
    }

    void error_log_sink(std::string_view message) {
        append_log_line(message);
    }

    void install_log_sinks(const statuskit::Paths& paths) {
        std::error_code ec;
        std::filesystem::create_directories(paths.log_path.parent_path(), ec);
        if (ec) {
            return;
        }
        g_log_path = paths.log_path;
        statuskit::set_debug_log_sink(debug_log_sink);
        statuskit::set_error_log_sink(error_log_sink);
    }

    void report_render_error(std::string_view context, std::string_view message) {
        statuskit::error_log(context, message);
    }

    int run_render(const statuskit::Command& command, statuskit::RenderEnvironment& environment) {
        std::string line;
        const bool  ok = statuskit::failsafe::guard([&] { line = statuskit::render_status(*command.widget_list, environment); }, report_render_error, "render");
        if (ok) {
            std::cout << line << '\n';
        } else {
            std::cout << '\n';
        }
        return 0;
    }

    int run_options(const statuskit::Command& command, const statuskit::OptionSource& host, const statuskit::WidgetCatalog& catalog) {
        const std::string filter = command.widget.value_or("");
        if (!filter.empty() && !catalog.contains(filter)) {
            std::cerr << "statuskit: unknown widget " << filter << '\n';
            return 1;
        }
        statuskit::OptionRegistry registry(host);
        statuskit::declare_catalog_options(catalog, registry);
        if (command.json) {
            std::cout << statuskit::render_options_json(registry, filter) << '\n';
        } else {
            std::cout << statuskit::render_options_text(registry, filter);
        }
        return 0;
    }

    int run_cache_clear(const statuskit::Command& command, statuskit::FileCacheStore& cache) {
        if (command.cache_key) {
            if (!cache.invalidate(*command.cache_key)) {
                std::cout << "no cache entry for " << *command.cache_key << '\n';
                return 0;
            }
            std::cout << "removed " << *command.cache_key << '\n';
            return 0;
        }
        std::cout << "removed " << cache.clear_all() << " cache entries\n";
        return 0;
    }

    int run_colors(const statuskit::Config& config, const statuskit::Paths& paths) {
        const statuskit::ColorResolver colors(statuskit::load_theme(config, paths));
        std::cout << "# " << colors.palette_name() << '\n';
        for (const auto& [name, value] : colors.all_colors()) {
            std::cout << name << ' ' << value << '\n';
        }
        return 0;
    }

} // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> tokens(argv + 1, argv + argc);
    const auto                     parsed = statuskit::parse_command(tokens);
    if (const auto* error = std::get_if<statuskit::ParseError>(&parsed)) {
        std::cerr << "statuskit: " << error->message << '\n' << statuskit::usage_text();
        return statuskit::kUsageExitCode;
    }
    const auto& command = std::get<statuskit::Command>(parsed);
    if (command.kind == statuskit::CommandKind::kHelp) {
        std::cout << "statuskit " << statuskit::kVersion << '\n' << statuskit::usage_text();
        return 0;
    }

    statuskit::PosixCommandRunner runner;
    statuskit::TmuxClient         host_client(runner);
    statuskit::TmuxOptionSource   host(host_client);

    statuskit::ConfigOverrides cli;
    if (command.theme_file) {
        cli.theme_file = command.theme_file;
    }
    if (command.transparent) {
        cli.transparent = true;
    }
    const auto config = statuskit::apply_overrides(statuskit::apply_overrides(statuskit::Config{}, statuskit::config_overrides_from_options(host)), cli);

    const auto paths = statuskit::try_resolve_paths(statuskit::env_config_from_environment(), config.cache_directory.value_or(std::string(statuskit::kDefaultCacheDirectoryName)));
    if (!paths) {
        if (command.kind == statuskit::CommandKind::kRender) {
            std::cout << '\n';
            return 0;
        }
        std::cerr << "statuskit: missing HOME/XDG_CONFIG_HOME\n";
        return 1;
    }

    statuskit::set_debug_logging(config.debug_logging);
    install_log_sinks(*paths);

    const auto                timeout = std::chrono::milliseconds(config.command_timeout_ms);
    statuskit::TmuxClient     tmux(runner, timeout);
    statuskit::TmuxNotifier   notifier(tmux);
    statuskit::FileCacheStore cache(paths->cache_dir);
    const auto                catalog = statuskit::WidgetCatalog::builtin();

    int status = 0;
    switch (command.kind) {
        case statuskit::CommandKind::kRender: {
            statuskit::RenderEnvironment environment{
                .config   = config,
                .paths    = *paths,
                .host     = host,
                .cache    = cache,
                .runner   = runner,
                .tmux     = tmux,
                .notifier = notifier,
                .catalog  = catalog,
            };
            status = run_render(command, environment);
            break;
        }
        case statuskit::CommandKind::kOptions: status = run_options(command, host, catalog); break;
        case statuskit::CommandKind::kCacheClear: status = run_cache_clear(command, cache); break;
        case statuskit::CommandKind::kColors: status = run_colors(config, *paths); break;
        case statuskit::CommandKind::kHelp: break;
    }

    statuskit::clear_debug_log_sink();
    statuskit::clear_error_log_sink();
    return status;
}
