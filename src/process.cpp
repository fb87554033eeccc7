#include "internal/process.hpp"

#include "internal/platform.hpp"

#include "systree/format.hpp"
#include "systree/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace systree::literals;

namespace systree::internal {

    namespace detail {

        static std::system_error errno_error(std::string_view what) {
            return std::system_error{errno, std::generic_category(), std::string{what}};
        }

#if !SYSTREE_PLATFORM_LINUX
        static void set_cloexec(int fd) {
            auto flags = ::fcntl(fd, F_GETFD);
            if (flags < 0 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0) {
                throw errno_error("fcntl(FD_CLOEXEC) failed");
            }
        }
#endif

        // Both ends close-on-exec, so concurrent spawns never inherit each other's pipes
        static std::pair<unique_fd, unique_fd> make_pipe() {
            int fds[2]{};
#if SYSTREE_PLATFORM_LINUX
            // atomic: no window where a fork on another thread sees the fds without CLOEXEC
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                throw errno_error("pipe2() failed");
            }
            return {unique_fd{fds[0]}, unique_fd{fds[1]}};
#else
            if (::pipe(fds) != 0) {
                throw errno_error("pipe() failed");
            }
            unique_fd read_end{fds[0]};
            unique_fd write_end{fds[1]};
            set_cloexec(read_end.get());
            set_cloexec(write_end.get());
            return {std::move(read_end), std::move(write_end)};
#endif
        }

        static int decode_wait_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        // Kills and reaps the child unless it was already waited for
        class child_guard {
          public:
            explicit child_guard(pid_t pid) : pid_value(pid) {}

            child_guard(const child_guard&) = delete;
            child_guard& operator=(const child_guard&) = delete;

            ~child_guard() {
                if (!reaped) {
                    ::kill(pid_value, SIGKILL);
                    while (::waitpid(pid_value, nullptr, 0) < 0 && errno == EINTR) {}
                }
            }

            int wait() {
                int status = 0;
                while (::waitpid(pid_value, &status, 0) < 0) {
                    if (errno != EINTR) {
                        reaped = true;
                        throw errno_error("waitpid failed");
                    }
                }
                reaped = true;
                return decode_wait_status(status);
            }

            std::optional<int> try_wait() {
                int status = 0;
                auto rc = ::waitpid(pid_value, &status, WNOHANG);
                if (rc < 0) {
                    if (errno == EINTR) {
                        return std::nullopt;
                    }
                    reaped = true;
                    throw errno_error("waitpid failed");
                }
                if (rc == 0) {
                    return std::nullopt;
                }
                reaped = true;
                return decode_wait_status(status);
            }

            void kill() { ::kill(pid_value, SIGKILL); }

          private:
            pid_t pid_value{-1};
            bool reaped{false};
        };

        // Reads the child's exec errno; EOF means exec succeeded and closed the pipe
        static std::optional<int> read_exec_errno(int fd) {
            int child_errno = 0;
            for (;;) {
                auto n = ::read(fd, &child_errno, sizeof(child_errno));
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n == static_cast<ssize_t>(sizeof(child_errno))) {
                    return child_errno;
                }
                return std::nullopt;
            }
        }

    }  // namespace detail

    subprocess_result run_subprocess(const std::vector<std::string>& args, int timeout_ms) {
        if (args.empty()) {
            throw std::invalid_argument("run_subprocess: empty command");
        }

        // argv is built before fork; the child only makes async-signal-safe calls
        std::vector<char*> argv{};
        argv.reserve(args.size() + 1U);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        unique_fd devnull{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
        if (!devnull) {
            throw detail::errno_error("failed to open /dev/null");
        }

        auto [stdout_read, stdout_write] = detail::make_pipe();
        auto [stderr_read, stderr_write] = detail::make_pipe();
        auto [status_read, status_write] = detail::make_pipe();

        auto pid = ::fork();
        if (pid < 0) {
            throw detail::errno_error("fork() failed");
        }

        if (pid == 0) {
            if (::dup2(devnull.get(), STDIN_FILENO) < 0 || ::dup2(stdout_write.get(), STDOUT_FILENO) < 0 ||
                ::dup2(stderr_write.get(), STDERR_FILENO) < 0) {
                int err = errno;
                (void)::write(status_write.get(), &err, sizeof(err));
                _exit(127);
            }
            ::execv(argv[0], argv.data());
            int err = errno;
            (void)::write(status_write.get(), &err, sizeof(err));
            _exit(127);
        }

        detail::child_guard child{pid};

        stdout_write.reset();
        stderr_write.reset();
        status_write.reset();
        devnull.reset();

        if (auto exec_errno = detail::read_exec_errno(status_read.get())) {
            (void)child.wait();
            throw spawn_error{*exec_errno, std::generic_category(), "failed to execute {}"_format(args.front())};
        }
        status_read.reset();

        subprocess_result result{};
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        auto remaining_ms = [&deadline]() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())
                    .count();
        };

        // poll both pipes with timeout
        pollfd fds[2]{};
        fds[0] = {.fd = stdout_read.get(), .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_read.get(), .events = POLLIN, .revents = 0};
        int fds_open = 2;

        while (fds_open > 0) {
            auto remaining = remaining_ms();
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }

            int ret = ::poll(fds, 2, static_cast<int>(remaining));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw detail::errno_error("poll() failed");
            }
            if (ret == 0) {
                result.timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? result.stdout_output : result.stderr_output).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        stdout_read.reset();
        stderr_read.reset();

        // output closed early; the child may still be running
        while (!result.timed_out) {
            if (auto code = child.try_wait()) {
                result.exit_code = *code;
                return result;
            }
            if (remaining_ms() <= 0) {
                result.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        debug_log("killing ", args.front(), " after ", timeout_ms, "ms");
        child.kill();
        result.exit_code = child.wait();
        return result;
    }

    bool is_executable_file(const fs::path& path) {
        std::error_code ec{};
        if (!fs::is_regular_file(path, ec) || ec) {
            return false;
        }
        return ::access(path.c_str(), X_OK) == 0;
    }

    std::optional<fs::path> find_executable(std::string_view name, std::string_view search_path) {
        if (name.empty()) {
            return std::nullopt;
        }
        if (name.find('/') != std::string_view::npos) {
            fs::path candidate{name};
            if (is_executable_file(candidate)) {
                return candidate;
            }
            return std::nullopt;
        }

        for (const auto& dir : utils::split(search_path, platform::path_list_separator)) {
            // an empty entry means the current directory
            auto candidate = (dir.empty() ? fs::path{"."} : fs::path{dir}) / name;
            if (is_executable_file(candidate)) {
                return candidate;
            }
        }
        return std::nullopt;
    }

}  // namespace systree::internal
