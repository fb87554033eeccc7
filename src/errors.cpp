#include "systree/errors.hpp"

#include "systree/format.hpp"
#include "systree/utils.hpp"

#include <string>
#include <utility>

namespace fs = std::filesystem;
using namespace systree::literals;

namespace systree::errors {

    error input_not_found(const fs::path& path) {
        return error{
                error_kind::input_not_found,
                "input path does not exist: {}"_format(path.string()),
                error_details{.path = path}};
    }

    error binary_not_found(std::string_view name, std::string_view search_path) {
        debug_log("engine '", name, "' not found in: ", search_path);
        return error{
                error_kind::binary_not_found,
                "{} not found on PATH; install with: cargo install syster-cli"_format(name)};
    }

    error spawn_failed(const fs::path& binary, std::string_view reason) {
        return error{
                error_kind::binary_not_found,
                "failed to execute {}: {}"_format(binary.string(), reason),
                error_details{.path = binary}};
    }

    error fetch_failed(std::string_view url, std::string_view reason) {
        return error{
                error_kind::dependency_fetch_failure,
                "failed to fetch standard library from {}: {}"_format(url, reason)};
    }

    error process_failed(int exit_code, std::string stdout_text, std::string stderr_text) {
        auto diagnostic = utils::trim_ascii(stderr_text);
        if (diagnostic.empty()) {
            diagnostic = utils::trim_ascii(stdout_text);
        }
        auto message = "engine failed with exit code {}: {}"_format(exit_code, utils::decode_utf8_lossy(diagnostic));
        return error{
                error_kind::process_execution_failure,
                message,
                error_details{
                        .exit_code = exit_code,
                        .stdout_text = std::move(stdout_text),
                        .stderr_text = std::move(stderr_text)}};
    }

    error parse_failed(std::string_view what, std::string stdout_text, std::string stderr_text) {
        auto message = "could not parse {}: {}"_format(what, stdout_text);
        if (!stderr_text.empty()) {
            message.append("\nstderr: ").append(stderr_text);
        }
        return error{
                error_kind::output_parse_failure,
                message,
                error_details{.stdout_text = std::move(stdout_text), .stderr_text = std::move(stderr_text)}};
    }

    error timed_out(std::string_view what, int timeout_ms, std::string stdout_text, std::string stderr_text) {
        return error{
                error_kind::timeout,
                "{} timed out after {}ms"_format(what, timeout_ms),
                error_details{.stdout_text = std::move(stdout_text), .stderr_text = std::move(stderr_text)}};
    }

}  // namespace systree::errors
