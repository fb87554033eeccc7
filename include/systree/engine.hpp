#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "models.hpp"
#include "stdlib.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace systree {

    /*
     * Everything an invocation reads from the outside world, passed explicitly.
     *
     * - engine: executable name searched on search_path, or a path containing '/'.
     * - search_path: colon-separated directory list (normally $PATH).
     * - stdlib_env/stdlib: inputs and settings for standard library resolution.
     * - fetcher: archive downloader; a curl_fetcher is used when null.
     */
    struct engine_context {
        std::string engine{defaults::engine_name};
        std::string search_path{};
        stdlib_environment stdlib_env{};
        stdlib_settings stdlib{};
        std::shared_ptr<archive_fetcher> fetcher{};

        static engine_context from_process();
    };

    struct invocation {
        std::vector<std::string> command{};
        int exit_code{};
        std::string stdout_text{};
        std::vector<uint8_t> stdout_bytes{};
        std::string stderr_text{};
    };

    std::filesystem::path find_engine(std::string_view name, std::string_view search_path);

    // [binary, --verbose?, --no-stdlib | --stdlib-path <dir>, operation flags..., input]
    std::vector<std::string> build_command(
            const std::filesystem::path& binary,
            const run_options& opts,
            const std::optional<std::filesystem::path>& stdlib_dir,
            const std::vector<std::string>& operation_flags,
            const std::filesystem::path& input);

    /*
     * Runs the engine once on `input`.
     *
     * Checks, in order: input exists, engine found, standard library resolved (only when
     * enabled without an explicit path). Text transport fills stdout_text; binary transport
     * fills stdout_bytes untouched. A non-zero exit throws process_execution_failure.
     */
    invocation invoke(
            const engine_context& ctx,
            const std::filesystem::path& input,
            const std::vector<std::string>& operation_flags,
            transport_mode transport,
            const run_options& opts = {});

    analysis_result analyze(const engine_context& ctx, const std::filesystem::path& path, const run_options& opts = {});

    std::vector<file_symbols> get_symbols(
            const engine_context& ctx, const std::filesystem::path& path, const run_options& opts = {});

    std::string export_xmi(const engine_context& ctx, const std::filesystem::path& path, const run_options& opts = {});

    // JSON-LD document text; validated to be a JSON array or object
    std::string export_jsonld(const engine_context& ctx, const std::filesystem::path& path, const run_options& opts = {});

    // KPAR archive bytes (ZIP)
    std::vector<uint8_t> export_kpar(
            const engine_context& ctx, const std::filesystem::path& path, const run_options& opts = {});

    analysis_result import_file(const engine_context& ctx, const std::filesystem::path& path, const run_options& opts = {});

    std::vector<file_symbols> import_symbols(
            const engine_context& ctx, const std::filesystem::path& path, const run_options& opts = {});

    std::string decompile(const engine_context& ctx, const std::filesystem::path& path, const run_options& opts = {});

    // Import then re-export, preserving element ids
    std::vector<uint8_t> import_export(
            const engine_context& ctx,
            const std::filesystem::path& path,
            roundtrip_format format,
            const run_options& opts = {});

}  // namespace systree
