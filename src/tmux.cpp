#include "statuskit/tmux.hpp"

#include <utility>

#include "statuskit/logging.hpp"
#include "statuskit/strings.hpp"

namespace statuskit {

    namespace {

        std::string unquote(std::string_view value) {
            if (value.size() < 2) {
                return std::string(value);
            }
            const char quote = value.front();
            if ((quote != '"' && quote != '\'') || value.back() != quote) {
                return std::string(value);
            }
            value = value.substr(1, value.size() - 2);
            std::string out;
            out.reserve(value.size());
            for (size_t i = 0; i < value.size(); ++i) {
                if (quote == '"' && value[i] == '\\' && i + 1 < value.size()) {
                    ++i;
                }
                out.push_back(value[i]);
            }
            return out;
        }

    } // namespace

    std::unordered_map<std::string, std::string> parse_show_options(std::string_view text) {
        std::unordered_map<std::string, std::string> options;
        for (const auto& raw_line : split(text, '\n')) {
            const auto line = trim_view(raw_line);
            if (line.empty()) {
                continue;
            }
            const auto space = line.find(' ');
            if (space == std::string_view::npos) {
                options[std::string(line)] = "";
                continue;
            }
            options[std::string(line.substr(0, space))] = unquote(trim_view(line.substr(space + 1)));
        }
        return options;
    }

    TmuxClient::TmuxClient(CommandRunner& runner, std::chrono::milliseconds timeout) : runner_(runner), timeout_(timeout) {}

    TmuxResult<std::string> TmuxClient::invoke(std::vector<std::string> argv, std::string_view context) {
        argv.insert(argv.begin(), "tmux");
        auto result = runner_.run(argv, timeout_);
        if (!result) {
            return std::unexpected(TmuxErrorInfo{std::string(context), result.error()});
        }
        if (result->timed_out) {
            return std::unexpected(TmuxErrorInfo{std::string(context), "timed out"});
        }
        if (result->exit_code != 0) {
            return std::unexpected(TmuxErrorInfo{std::string(context), "exit code " + std::to_string(result->exit_code)});
        }
        return std::move(result->output);
    }

    TmuxResult<std::unordered_map<std::string, std::string>> TmuxClient::global_options() {
        auto output = invoke({"show-options", "-g"}, "show-options");
        if (!output) {
            return std::unexpected(output.error());
        }
        return parse_show_options(*output);
    }

    TmuxResult<std::string> TmuxClient::expand_format(std::string_view format) {
        auto output = invoke({"display-message", "-p", std::string(format)}, "display-message");
        if (!output) {
            return std::unexpected(output.error());
        }
        return strip_trailing_newlines(*output);
    }

    TmuxResult<void> TmuxClient::display_message(std::string_view message, std::chrono::milliseconds duration) {
        auto output = invoke({"display-message", "-d", std::to_string(duration.count()), std::string(message)}, "display-message");
        if (!output) {
            return std::unexpected(output.error());
        }
        return {};
    }

    TmuxOptionSource::TmuxOptionSource(TmuxClient& client) : client_(client) {}

    void TmuxOptionSource::load() const {
        if (loaded_) {
            return;
        }
        loaded_ = true;
        auto options = client_.global_options();
        if (!options) {
            debug_log("tmux", format_tmux_error(options.error()));
            return;
        }
        values_ = std::move(*options);
    }

    std::optional<std::string> TmuxOptionSource::get(std::string_view name) const {
        load();
        const auto it = values_.find(std::string(name));
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

} // namespace statuskit
