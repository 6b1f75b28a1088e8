#include "statuskit/command_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "statuskit/file_descriptor.hpp"
#include "statuskit/logging.hpp"
#include "statuskit/strings.hpp"

namespace statuskit {

    namespace {

        [[noreturn]] void exec_child(const std::vector<std::string>& argv, int stdout_fd) {
            const int null_fd = ::open("/dev/null", O_RDWR);
            if (null_fd >= 0) {
                ::dup2(null_fd, STDIN_FILENO);
                ::dup2(null_fd, STDERR_FILENO);
                ::close(null_fd);
            }
            ::dup2(stdout_fd, STDOUT_FILENO);
            ::signal(SIGPIPE, SIG_DFL);

            std::vector<char*> args;
            args.reserve(argv.size() + 1);
            for (const auto& arg : argv) {
                args.push_back(const_cast<char*>(arg.c_str()));
            }
            args.push_back(nullptr);
            ::execvp(args[0], args.data());
            ::_exit(127);
        }

        int wait_for_exit(pid_t pid) {
            int   status = 0;
            pid_t result = 0;
            do {
                result = ::waitpid(pid, &status, 0);
            } while (result == -1 && errno == EINTR);
            if (result == -1) {
                return -1;
            }
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return -1;
        }

    } // namespace

    std::expected<CommandResult, std::string> PosixCommandRunner::run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
        if (argv.empty() || argv.front().empty()) {
            return std::unexpected(std::string("empty command"));
        }
        auto pipe = open_pipe();
        if (!pipe) {
            return std::unexpected("pipe failed: " + std::string(std::strerror(errno)));
        }

        const pid_t pid = ::fork();
        if (pid < 0) {
            return std::unexpected("fork failed: " + std::string(std::strerror(errno)));
        }
        if (pid == 0) {
            exec_child(argv, pipe->write_end.get());
        }
        pipe->write_end.reset();

        CommandResult result;
        const auto    deadline = std::chrono::steady_clock::now() + timeout;
        char          buffer[4096];
        while (true) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            pollfd descriptor{.fd = pipe->read_end.get(), .events = POLLIN, .revents = 0};
            const int ready = ::poll(&descriptor, 1, static_cast<int>(remaining.count()));
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ready == 0) {
                result.timed_out = true;
                break;
            }
            const ssize_t count = ::read(pipe->read_end.get(), buffer, sizeof(buffer));
            if (count < 0 && errno == EINTR) {
                continue;
            }
            if (count <= 0) {
                break;
            }
            const auto room = kMaxCommandOutput - std::min(kMaxCommandOutput, result.output.size());
            result.output.append(buffer, std::min(room, static_cast<std::size_t>(count)));
        }

        if (result.timed_out) {
            ::kill(pid, SIGKILL);
            debug_log("command", "timed out after " + std::to_string(timeout.count()) + "ms: " + argv.front());
        }
        result.exit_code = wait_for_exit(pid);
        return result;
    }

    std::vector<std::string> shell_argv(std::string_view command) {
        return {"/bin/sh", "-c", std::string(command)};
    }

    bool command_exists(std::string_view name, std::string_view search_path) {
        if (name.empty()) {
            return false;
        }
        if (name.find('/') != std::string_view::npos) {
            return ::access(std::string(name).c_str(), X_OK) == 0;
        }
        for (const auto& directory : split(search_path, ':')) {
            if (directory.empty()) {
                continue;
            }
            const auto candidate = directory + "/" + std::string(name);
            if (::access(candidate.c_str(), X_OK) == 0) {
                return true;
            }
        }
        return false;
    }

    bool command_exists(std::string_view name) {
        const char* path = std::getenv("PATH");
        return command_exists(name, path ? std::string_view(path) : std::string_view("/usr/bin:/bin"));
    }

    std::string strip_trailing_newlines(std::string_view output) {
        while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
            output.remove_suffix(1);
        }
        return std::string(output);
    }

} // namespace statuskit
