#include "binmodel/process.hpp"

#include "binmodel/format.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <array>
#include <cerrno>
#include <stdexcept>

using namespace binmodel::literals;

namespace binmodel {

    namespace detail {

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        static std::string read_all(int fd) {
            std::string text{};
            std::array<char, 4096> buffer{};
            while (true) {
                auto n = ::read(fd, buffer.data(), buffer.size());
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    throw std::runtime_error("failed to read tool output");
                }
                if (n == 0) {
                    break;
                }
                text.append(buffer.data(), static_cast<size_t>(n));
            }
            return text;
        }

        static int wait_for(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    throw std::runtime_error("waitpid failed");
                }
            }

            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    }  // namespace detail

    tool_output run_tool(const std::vector<std::string>& args) {
        if (args.empty()) {
            throw std::runtime_error("run_tool requires an executable");
        }

        std::array<int, 2> out_pipe{-1, -1};
        if (::pipe(out_pipe.data()) < 0) {
            throw std::runtime_error("failed to create pipe for {}"_format(args.front()));
        }

        auto pid = ::fork();
        if (pid < 0) {
            detail::close_fd(out_pipe[0]);
            detail::close_fd(out_pipe[1]);
            throw std::runtime_error("fork failed");
        }

        if (pid == 0) {
            auto null_fd = ::open("/dev/null", O_WRONLY);
            if (null_fd < 0 || ::dup2(null_fd, STDERR_FILENO) < 0) {
                _exit(127);
            }
            if (::dup2(out_pipe[1], STDOUT_FILENO) < 0) {
                _exit(127);
            }

            ::close(null_fd);
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);

            std::vector<char*> argv{};
            argv.reserve(args.size() + 1U);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        detail::close_fd(out_pipe[1]);

        tool_output output{};
        try {
            output.text = detail::read_all(out_pipe[0]);
        } catch (...) {
            detail::close_fd(out_pipe[0]);
            // reap the child before propagating; its status is moot
            static_cast<void>(detail::wait_for(pid));
            throw;
        }
        detail::close_fd(out_pipe[0]);

        output.exit_code = detail::wait_for(pid);
        return output;
    }

}  // namespace binmodel
