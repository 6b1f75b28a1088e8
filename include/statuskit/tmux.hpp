#ifndef STATUSKIT_TMUX_HPP
#define STATUSKIT_TMUX_HPP

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "statuskit/command_runner.hpp"
#include "statuskit/option_source.hpp"

namespace statuskit {

    struct TmuxErrorInfo {
        std::string context;
        std::string message;
    };

    inline std::string format_tmux_error(const TmuxErrorInfo& error) {
        std::string text = error.context;
        if (!text.empty() && !error.message.empty()) {
            text.append(": ");
        }
        text.append(error.message);
        return text;
    }

    template <typename T>
    using TmuxResult = std::expected<T, TmuxErrorInfo>;

    // Parses `tmux show-options -g` output. Quoted values are unquoted and
    // their backslash escapes resolved.
    std::unordered_map<std::string, std::string> parse_show_options(std::string_view text);

    class TmuxClient {
      public:
        explicit TmuxClient(CommandRunner& runner, std::chrono::milliseconds timeout = kDefaultCommandTimeout);

        TmuxResult<std::unordered_map<std::string, std::string>> global_options();
        TmuxResult<std::string>                                  expand_format(std::string_view format);
        TmuxResult<void>                                         display_message(std::string_view message, std::chrono::milliseconds duration);

      private:
        TmuxResult<std::string> invoke(std::vector<std::string> argv, std::string_view context);

        CommandRunner&            runner_;
        std::chrono::milliseconds timeout_;
    };

    // Snapshot of the global options, fetched once on first use.
    class TmuxOptionSource final : public OptionSource {
      public:
        explicit TmuxOptionSource(TmuxClient& client);

        std::optional<std::string> get(std::string_view name) const override;

      private:
        void                                                 load() const;

        TmuxClient&                                          client_;
        mutable bool                                         loaded_ = false;
        mutable std::unordered_map<std::string, std::string> values_;
    };

} // namespace statuskit

#endif // STATUSKIT_TMUX_HPP
