#include "statuskit/adapter.hpp"

#include <utility>

#include "statuskit/failsafe.hpp"
#include "statuskit/logging.hpp"
#include "statuskit/strings.hpp"

namespace statuskit {

    namespace {

        bool has_format(std::string_view text) {
            const auto open = text.find("#{");
            return open != std::string_view::npos && text.find('}', open) != std::string_view::npos;
        }

        std::optional<std::string_view> command_body(std::string_view content) {
            if (content.size() >= 3 && (content.starts_with("#(") || content.starts_with("$(")) && content.back() == ')') {
                return content.substr(2, content.size() - 3);
            }
            return std::nullopt;
        }

        bool condition_passes(std::string_view result) {
            const auto trimmed = trim_view(result);
            return !trimmed.empty() && trimmed != "false" && trimmed != "0";
        }

        void log_widget_error(std::string_view context, std::string_view message) {
            error_log(context, message);
        }

    } // namespace

    std::string external_cache_key(std::string_view content) {
        return "external_" + std::to_string(fnv1a_hash(content));
    }

    WidgetAdapter::WidgetAdapter(WidgetContext& context, const ColorResolver& colors, Notifier& notifier) : context_(context), colors_(colors), notifier_(notifier) {}

    std::optional<Segment> WidgetAdapter::build(Widget& widget, const InternalEntry& entry) {
        std::optional<Segment> segment;
        const auto             context = "widget " + entry.name;
        (void)failsafe::guard([&] { segment = build_internal(widget, entry); }, log_widget_error, context);
        return segment;
    }

    std::optional<Segment> WidgetAdapter::build(const ExternalEntry& entry) {
        std::optional<Segment> segment;
        const auto             context = "external " + entry.name;
        (void)failsafe::guard([&] { segment = build_external(entry); }, log_widget_error, context);
        return segment;
    }

    bool WidgetAdapter::dependencies_met(Widget& widget) {
        const auto* provider = dynamic_cast<const DependencyProvider*>(&widget);
        if (!provider) {
            return true;
        }
        const auto missing = provider->missing_dependencies(context_);
        if (missing.empty()) {
            return true;
        }
        const auto message = missing_dependency_text(widget.name(), missing);
        error_log("widgets", message);
        if (notified_.emplace(widget.name()).second) {
            notifier_.notify(message);
        }
        return false;
    }

    std::optional<Segment> WidgetAdapter::build_internal(Widget& widget, const InternalEntry& entry) {
        if (!dependencies_met(widget)) {
            return std::nullopt;
        }

        const auto content = widget.produce(context_);
        if (content.empty()) {
            debug_log("widgets", entry.name + " produced no content");
            return std::nullopt;
        }

        auto&       options     = context_.options;
        const auto  type        = entry.type.value_or(widget.type());
        std::string accent      = !entry.accent.empty() ? entry.accent : options.resolve(widget.name(), "accent_color");
        std::string accent_icon = !entry.accent_icon.empty() ? entry.accent_icon : options.resolve(widget.name(), "accent_color_icon");
        std::string icon        = !entry.icon.empty() ? entry.icon : options.resolve(widget.name(), "icon");
        if (accent.empty()) {
            accent = std::string(kDefaultAccent);
        }
        if (accent_icon.empty()) {
            accent_icon = std::string(kDefaultAccentIcon);
        }
        const std::string configured_accent = accent;

        if (auto* provider = dynamic_cast<DisplayInfoProvider*>(&widget)) {
            auto info = provider->display_info(content, context_);
            if (!info.visible && type == WidgetType::kConditional) {
                debug_log("widgets", entry.name + " hidden by its display rule");
                return std::nullopt;
            }
            if (!info.accent.empty()) {
                accent = std::move(info.accent);
            }
            if (!info.accent_icon.empty()) {
                accent_icon = std::move(info.accent_icon);
            }
            if (!info.icon.empty()) {
                icon = std::move(info.icon);
            }
        }

        const bool has_threshold = accent != configured_accent;
        return colorize(std::string(widget.name()), clean_content(content), std::move(icon), accent, accent_icon, has_threshold);
    }

    std::optional<Segment> WidgetAdapter::build_external(const ExternalEntry& entry) {
        std::string content;
        if (entry.ttl > 0) {
            content = context_.cache.get_or_compute(external_cache_key(entry.content), entry.ttl, [&] { return evaluate_content(entry.content); });
        } else {
            content = evaluate_content(entry.content);
        }

        if (!entry.condition.empty() && !condition_passes(evaluate_content(entry.condition))) {
            debug_log("widgets", entry.name + " condition not met");
            return std::nullopt;
        }
        if (content.empty()) {
            return std::nullopt;
        }

        const std::string_view accent      = entry.accent.empty() ? kDefaultAccent : std::string_view(entry.accent);
        const std::string_view accent_icon = entry.accent_icon.empty() ? kDefaultAccentIcon : std::string_view(entry.accent_icon);
        return colorize(entry.name, std::move(content), entry.icon, accent, accent_icon, false);
    }

    std::string WidgetAdapter::evaluate_content(std::string_view content) {
        if (const auto body = command_body(content)) {
            std::string command(*body);
            if (has_format(command)) {
                command = expand_format(command);
            }
            return run_shell(command);
        }
        if (has_format(content)) {
            return expand_format(content);
        }
        return std::string(content);
    }

    std::string WidgetAdapter::run_shell(std::string_view command) {
        if (trim_view(command).empty()) {
            return {};
        }
        const auto result = context_.runner.run(shell_argv(command), context_.command_timeout);
        if (!result) {
            debug_log("widgets", "command failed to start: " + result.error());
            return {};
        }
        if (!result->ok()) {
            debug_log("widgets", "command exited with " + std::to_string(result->exit_code) + ": " + std::string(command));
            return {};
        }
        return strip_trailing_newlines(result->output);
    }

    std::string WidgetAdapter::expand_format(std::string_view text) {
        auto expanded = context_.tmux.expand_format(text);
        if (!expanded) {
            debug_log("widgets", format_tmux_error(expanded.error()));
            return {};
        }
        return std::move(*expanded);
    }

    Segment WidgetAdapter::colorize(std::string name, std::string content, std::string icon, std::string_view accent, std::string_view accent_icon, bool has_threshold) const {
        const std::string accent_name(accent);
        return Segment{
            .name          = std::move(name),
            .content       = std::move(content),
            .icon          = std::move(icon),
            .accent        = colors_.resolve(accent_name),
            .accent_icon   = colors_.resolve(accent_icon),
            .accent_strong = colors_.resolve(accent_name + "-strong"),
            .accent_subtle = colors_.resolve(accent_name + "-subtle"),
            .has_threshold = has_threshold,
        };
    }

} // namespace statuskit
