#include "statuskit/command.hpp"

#include <cctype>

namespace statuskit {

    namespace {

        std::optional<std::string> split_tokens(std::string_view args, std::vector<std::string>* tokens) {
            std::string current;
            bool        in_quotes = false;
            bool        escaped   = false;
            bool        quoted    = false;
            char        quote     = '\0';
            for (const char ch : args) {
                if (escaped) {
                    current.push_back(ch);
                    escaped = false;
                    continue;
                }
                if (in_quotes && ch == '\\') {
                    escaped = true;
                    continue;
                }
                if (in_quotes) {
                    if (ch == quote) {
                        in_quotes = false;
                        continue;
                    }
                    current.push_back(ch);
                    continue;
                }
                if (ch == '"' || ch == '\'') {
                    in_quotes = true;
                    quoted    = true;
                    quote     = ch;
                    continue;
                }
                if (std::isspace(static_cast<unsigned char>(ch))) {
                    if (!current.empty() || quoted) {
                        tokens->push_back(current);
                        current.clear();
                        quoted = false;
                    }
                    continue;
                }
                current.push_back(ch);
            }
            if (escaped || in_quotes) {
                return std::string("unterminated quote");
            }
            if (!current.empty() || quoted) {
                tokens->push_back(std::move(current));
            }
            return std::nullopt;
        }

        bool is_flag(const std::string& token) {
            return token.starts_with("--");
        }

        std::optional<ParseError> take_theme_file(const std::vector<std::string>& tokens, size_t* index, Command* command) {
            if (*index + 1 >= tokens.size()) {
                return ParseError{"missing theme file path"};
            }
            command->theme_file = tokens[*index + 1];
            ++*index;
            return std::nullopt;
        }

    } // namespace

    std::variant<Command, ParseError> parse_command(const std::vector<std::string>& tokens) {
        if (tokens.empty()) {
            return ParseError{"missing command"};
        }

        if (tokens[0] == "help" || tokens[0] == "--help" || tokens[0] == "-h") {
            return Command{.kind = CommandKind::kHelp};
        }

        if (tokens[0] == "render") {
            Command command{.kind = CommandKind::kRender};
            for (size_t i = 1; i < tokens.size(); ++i) {
                if (tokens[i] == "--transparent") {
                    command.transparent = true;
                    continue;
                }
                if (tokens[i] == "--theme-file") {
                    if (const auto error = take_theme_file(tokens, &i, &command)) {
                        return *error;
                    }
                    continue;
                }
                if (is_flag(tokens[i])) {
                    return ParseError{"unknown render option"};
                }
                if (command.widget_list) {
                    return ParseError{"unexpected extra arguments"};
                }
                command.widget_list = tokens[i];
            }
            if (!command.widget_list) {
                return ParseError{"missing widget list"};
            }
            return command;
        }

        if (tokens[0] == "options") {
            Command command{.kind = CommandKind::kOptions};
            for (size_t i = 1; i < tokens.size(); ++i) {
                if (tokens[i] == "--json") {
                    command.json = true;
                    continue;
                }
                if (is_flag(tokens[i])) {
                    return ParseError{"unknown options option"};
                }
                if (command.widget) {
                    return ParseError{"unexpected extra arguments"};
                }
                command.widget = tokens[i];
            }
            return command;
        }

        if (tokens[0] == "cache") {
            if (tokens.size() < 2) {
                return ParseError{"missing cache subcommand"};
            }
            if (tokens[1] != "clear") {
                return ParseError{"unknown cache subcommand"};
            }
            if (tokens.size() > 3) {
                return ParseError{"unexpected extra arguments"};
            }
            Command command{.kind = CommandKind::kCacheClear};
            if (tokens.size() == 3) {
                command.cache_key = tokens[2];
            }
            return command;
        }

        if (tokens[0] == "colors") {
            Command command{.kind = CommandKind::kColors};
            for (size_t i = 1; i < tokens.size(); ++i) {
                if (tokens[i] == "--theme-file") {
                    if (const auto error = take_theme_file(tokens, &i, &command)) {
                        return *error;
                    }
                    continue;
                }
                return ParseError{"unknown colors option"};
            }
            return command;
        }

        return ParseError{"unknown command"};
    }

    std::variant<Command, ParseError> parse_command(std::string_view args) {
        std::vector<std::string> tokens;
        if (const auto error = split_tokens(args, &tokens)) {
            return ParseError{*error};
        }
        return parse_command(tokens);
    }

    std::string usage_text() {
        return "usage:\n"
               "  statuskit render <widget-list> [--theme-file PATH] [--transparent]\n"
               "  statuskit options [widget] [--json]\n"
               "  statuskit cache clear [key]\n"
               "  statuskit colors [--theme-file PATH]\n";
    }

} // namespace statuskit
