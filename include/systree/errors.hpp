#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace systree {

    enum class error_kind : uint8_t {
        input_not_found,
        binary_not_found,
        dependency_fetch_failure,
        process_execution_failure,
        output_parse_failure,
        timeout,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::input_not_found:
                return "input_not_found"sv;
            case error_kind::binary_not_found:
                return "binary_not_found"sv;
            case error_kind::dependency_fetch_failure:
                return "dependency_fetch_failure"sv;
            case error_kind::process_execution_failure:
                return "process_execution_failure"sv;
            case error_kind::output_parse_failure:
                return "output_parse_failure"sv;
            case error_kind::timeout:
                return "timeout"sv;
        }
        return "process_execution_failure"sv;
    }

    struct error_details {
        std::optional<int> exit_code{};
        std::string stdout_text{};
        std::string stderr_text{};
        std::optional<std::filesystem::path> path{};
    };

    // Every failure surfaced by the engine client; callers branch on kind()
    class error : public std::runtime_error {
      public:
        error(error_kind kind, const std::string& message, error_details details = {})
                : std::runtime_error{message}, kind_value{kind}, details{std::move(details)} {}

        error_kind kind() const noexcept { return kind_value; }
        std::optional<int> exit_code() const noexcept { return details.exit_code; }
        const std::string& stdout_text() const noexcept { return details.stdout_text; }
        const std::string& stderr_text() const noexcept { return details.stderr_text; }
        const std::optional<std::filesystem::path>& path() const noexcept { return details.path; }

      private:
        error_kind kind_value{};
        error_details details{};
    };

    namespace errors {
        error input_not_found(const std::filesystem::path& path);
        error binary_not_found(std::string_view name, std::string_view search_path);
        error spawn_failed(const std::filesystem::path& binary, std::string_view reason);
        error fetch_failed(std::string_view url, std::string_view reason);
        error process_failed(int exit_code, std::string stdout_text, std::string stderr_text);
        error parse_failed(std::string_view what, std::string stdout_text, std::string stderr_text);
        error timed_out(std::string_view what, int timeout_ms, std::string stdout_text = {}, std::string stderr_text = {});
    }  // namespace errors

}  // namespace systree
