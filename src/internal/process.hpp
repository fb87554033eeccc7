#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

extern "C" {
#include <unistd.h>
}

namespace systree::internal {

    // Owns one file descriptor; closed on destruction
    class unique_fd {
      public:
        unique_fd() = default;
        explicit unique_fd(int fd) : fd_value(fd) {}

        unique_fd(const unique_fd&) = delete;
        unique_fd& operator=(const unique_fd&) = delete;

        unique_fd(unique_fd&& other) noexcept : fd_value(other.release()) {}
        unique_fd& operator=(unique_fd&& other) noexcept {
            if (this != &other) {
                reset(other.release());
            }
            return *this;
        }

        ~unique_fd() { reset(); }

        int get() const { return fd_value; }
        explicit operator bool() const { return fd_value >= 0; }

        int release() {
            auto fd = fd_value;
            fd_value = -1;
            return fd;
        }

        void reset(int fd = -1) {
            if (fd_value >= 0) {
                ::close(fd_value);
            }
            fd_value = fd;
        }

      private:
        int fd_value{-1};
    };

    struct subprocess_result {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};
        bool timed_out{false};
    };

    /*
     * Runs args[0] (an executable path, not searched) with stdin on /dev/null and both output
     * streams captured through pipes, polled together until EOF or the deadline.
     *
     * On timeout the child is killed with SIGKILL and reaped; timed_out is set and the output
     * captured so far is returned. If exec itself fails, spawn_error is thrown with the errno
     * reported by the child. Pipe/fork/poll failures throw std::system_error.
     */
    subprocess_result run_subprocess(const std::vector<std::string>& args, int timeout_ms);

    struct spawn_error : std::system_error {
        using std::system_error::system_error;
    };

    bool is_executable_file(const std::filesystem::path& path);

    // First executable `name` in the colon-separated `search_path`; names containing '/' are checked as-is
    std::optional<std::filesystem::path> find_executable(std::string_view name, std::string_view search_path);

}  // namespace systree::internal
