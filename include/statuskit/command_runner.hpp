#ifndef STATUSKIT_COMMAND_RUNNER_HPP
#define STATUSKIT_COMMAND_RUNNER_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace statuskit {

    inline constexpr std::chrono::milliseconds kDefaultCommandTimeout{5000};
    inline constexpr std::size_t               kMaxCommandOutput = 64 * 1024;

    struct CommandResult {
        int         exit_code = -1;
        std::string output;
        bool        timed_out = false;

        bool ok() const {
            return exit_code == 0 && !timed_out;
        }
    };

    class CommandRunner {
      public:
        virtual ~CommandRunner() = default;

        // Runs argv with stdin and stderr bound to /dev/null and captures
        // stdout. An error is returned only when the process could not be
        // started; a non-zero exit is reported through CommandResult.
        virtual std::expected<CommandResult, std::string> run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) = 0;
    };

    class PosixCommandRunner final : public CommandRunner {
      public:
        std::expected<CommandResult, std::string> run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
    };

    std::vector<std::string> shell_argv(std::string_view command);

    // Looks the executable up in a PATH-style, colon separated list.
    bool                     command_exists(std::string_view name, std::string_view search_path);
    bool                     command_exists(std::string_view name);
    std::string              strip_trailing_newlines(std::string_view output);

} // namespace statuskit

#endif // STATUSKIT_COMMAND_RUNNER_HPP
