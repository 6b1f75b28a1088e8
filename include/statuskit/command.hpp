#ifndef STATUSKIT_COMMAND_HPP
#define STATUSKIT_COMMAND_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace statuskit {

    enum class CommandKind {
        kRender,
        kOptions,
        kCacheClear,
        kColors,
        kHelp,
    };

    struct Command {
        CommandKind                kind;
        std::optional<std::string> widget_list = std::nullopt;
        std::optional<std::string> widget      = std::nullopt;
        std::optional<std::string> cache_key   = std::nullopt;
        std::optional<std::string> theme_file  = std::nullopt;
        bool                       transparent = false;
        bool                       json        = false;
    };

    struct ParseError {
        std::string message;
    };

    inline constexpr int kUsageExitCode = 2;

    std::variant<Command, ParseError> parse_command(const std::vector<std::string>& tokens);
    // Splits on whitespace honoring single and double quotes.
    std::variant<Command, ParseError> parse_command(std::string_view args);

    std::string                       usage_text();

} // namespace statuskit

#endif // STATUSKIT_COMMAND_HPP
