#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace systree {

    using namespace std::string_view_literals;

    inline constexpr auto version = "0.2.0"sv;

    namespace defaults {
        inline constexpr auto engine_name = "syster"sv;
        inline constexpr auto stdlib_dirname = "sysml.library"sv;
        inline constexpr auto stdlib_env_var = "SYSTER_STDLIB_PATH"sv;
        inline constexpr auto stdlib_version = "2025-02"sv;
        inline constexpr auto stdlib_url_prefix = "https://github.com/Systems-Modeling/SysML-v2-Release/archive/refs/tags/"sv;
        inline constexpr auto cache_subdir = "systree"sv;

        inline constexpr int engine_timeout_ms{60'000};
        inline constexpr int download_timeout_ms{120'000};
    }  // namespace defaults

    enum class transport_mode : uint8_t { text, binary };
    enum class export_format : uint8_t { xmi, json_ld, kpar };
    enum class roundtrip_format : uint8_t { xmi, kpar, jsonld };
    enum class output_mode : uint8_t { table, json };

    inline constexpr std::string_view to_string(transport_mode mode) {
        switch (mode) {
            case transport_mode::text:
                return "text"sv;
            case transport_mode::binary:
                return "binary"sv;
        }
        return "text"sv;
    }

    // Token passed to the engine's --export flag
    inline constexpr std::string_view to_string(export_format format) {
        switch (format) {
            case export_format::xmi:
                return "xmi"sv;
            case export_format::json_ld:
                return "json-ld"sv;
            case export_format::kpar:
                return "kpar"sv;
        }
        return "xmi"sv;
    }

    // Token passed to --export after --import-workspace; the engine spells JSON-LD without the dash here
    inline constexpr std::string_view to_string(roundtrip_format format) {
        switch (format) {
            case roundtrip_format::xmi:
                return "xmi"sv;
            case roundtrip_format::kpar:
                return "kpar"sv;
            case roundtrip_format::jsonld:
                return "jsonld"sv;
        }
        return "xmi"sv;
    }

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr transport_mode transport_for(export_format format) {
        return format == export_format::kpar ? transport_mode::binary : transport_mode::text;
    }

    inline constexpr bool try_parse_export_format(std::string_view text, export_format& out) {
        if (utils::str_case_eq(text, "xmi"sv)) {
            out = export_format::xmi;
            return true;
        }
        if (utils::str_case_eq(text, "json-ld"sv) || utils::str_case_eq(text, "jsonld"sv)) {
            out = export_format::json_ld;
            return true;
        }
        if (utils::str_case_eq(text, "kpar"sv)) {
            out = export_format::kpar;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_roundtrip_format(std::string_view text, roundtrip_format& out) {
        if (utils::str_case_eq(text, "xmi"sv)) {
            out = roundtrip_format::xmi;
            return true;
        }
        if (utils::str_case_eq(text, "kpar"sv)) {
            out = roundtrip_format::kpar;
            return true;
        }
        if (utils::str_case_eq(text, "jsonld"sv) || utils::str_case_eq(text, "json-ld"sv)) {
            out = roundtrip_format::jsonld;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    /*
     * Per-operation options
     *
     * - verbose: Pass --verbose to the engine.
     * - stdlib: Load the standard library. When false, --no-stdlib is passed and
     *   stdlib_path is ignored.
     * - stdlib_path: Explicit library directory; skips resolution and download.
     * - timeout_ms: Wall-time budget for the engine process. The child is killed
     *   on expiry.
     */
    struct run_options {
        bool verbose{false};
        bool stdlib{true};
        std::optional<std::filesystem::path> stdlib_path{};
        int timeout_ms{defaults::engine_timeout_ms};
    };

    struct stdlib_settings {
        std::string version{defaults::stdlib_version};
        std::string dirname{defaults::stdlib_dirname};
        std::optional<std::string> url{};
        int download_timeout_ms{defaults::download_timeout_ms};

        std::string archive_url() const {
            if (url) {
                return *url;
            }
            std::string out{defaults::stdlib_url_prefix};
            out.append(version).append(".zip");
            return out;
        }
    };

    /*
     * systree Startup Config Options
     *
     * Engine
     * - engine: Engine executable name or path.
     * - search_path: Colon-separated directories searched for the engine; defaults to $PATH.
     * - timeout_ms: Wall-time budget per engine invocation.
     * - verbose: Pass --verbose to the engine and print progress to stderr.
     * - quiet: Suppress non-essential output.
     *
     * Standard library
     * - stdlib_enabled: Load the standard library (--no-stdlib when false).
     * - stdlib_path: Explicit library directory.
     * - stdlib_version: Release tag fetched when the library must be downloaded.
     * - stdlib_url: Archive URL override.
     * - cache_dir: Cache root override (default ${XDG_CACHE_HOME:-$HOME/.cache}/systree).
     * - download_timeout_ms: Wall-time budget for the archive download.
     *
     * Output
     * - output: Result rendering ("table" or "json").
     * - print_config: Print the resolved config and exit.
     */
    struct startup_config {
        std::string engine{defaults::engine_name};
        std::optional<std::string> search_path{};
        int timeout_ms{defaults::engine_timeout_ms};
        bool verbose{false};
        bool quiet{false};

        bool stdlib_enabled{true};
        std::optional<std::filesystem::path> stdlib_path{};
        std::string stdlib_version{defaults::stdlib_version};
        std::optional<std::string> stdlib_url{};
        std::optional<std::filesystem::path> cache_dir{};
        int download_timeout_ms{defaults::download_timeout_ms};

        output_mode output{output_mode::table};
        bool print_config{false};
    };

}  // namespace systree
