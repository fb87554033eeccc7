#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace systree {

    enum class stdlib_source : uint8_t {
        explicit_path,
        environment,
        cache,
        working_dir,
        install_sibling,
        download,
    };

    inline constexpr std::string_view to_string(stdlib_source source) {
        switch (source) {
            case stdlib_source::explicit_path:
                return "explicit"sv;
            case stdlib_source::environment:
                return "environment"sv;
            case stdlib_source::cache:
                return "cache"sv;
            case stdlib_source::working_dir:
                return "working_dir"sv;
            case stdlib_source::install_sibling:
                return "install_sibling"sv;
            case stdlib_source::download:
                return "download"sv;
        }
        return "download"sv;
    }

    struct stdlib_location {
        std::filesystem::path path{};
        stdlib_source source{stdlib_source::download};
    };

    /*
     * Process-wide search inputs for the standard library, captured once.
     *
     * - env_override: value of SYSTER_STDLIB_PATH, if set.
     * - cache_root: per-user cache root; the versioned library directory lives beneath it.
     * - working_dir: directory probed for ./sysml.library.
     * - install_dir: directory of the running executable; its parent is probed for a
     *   sibling sysml.library (development layout).
     */
    struct stdlib_environment {
        std::optional<std::string> env_override{};
        std::filesystem::path cache_root{};
        std::filesystem::path working_dir{};
        std::optional<std::filesystem::path> install_dir{};

        static stdlib_environment from_process();
    };

    // Retrieves the release archive; one call is one network request
    class archive_fetcher {
      public:
        virtual ~archive_fetcher() = default;

        virtual std::vector<uint8_t> fetch(const std::string& url, int timeout_ms) = 0;
    };

    // Downloads with the curl executable through the subprocess runner
    class curl_fetcher final : public archive_fetcher {
      public:
        explicit curl_fetcher(std::filesystem::path curl = "curl") : curl_path(std::move(curl)) {}

        std::vector<uint8_t> fetch(const std::string& url, int timeout_ms) override;

      private:
        std::filesystem::path curl_path{};
    };

    std::filesystem::path stdlib_cache_dir(const stdlib_environment& env, const stdlib_settings& settings);

    // Steps 1-5 of the search order; never downloads
    std::optional<stdlib_location> find_stdlib(
            const std::optional<std::filesystem::path>& override_path,
            const stdlib_environment& env,
            const stdlib_settings& settings);

    // find_stdlib, then the download step when nothing matched
    stdlib_location resolve_stdlib(
            const std::optional<std::filesystem::path>& override_path,
            const stdlib_environment& env,
            const stdlib_settings& settings,
            archive_fetcher& fetcher);

    /*
     * Download step. Returns the cache directory, fetching and extracting the release archive
     * only if that directory is missing or empty.
     *
     * Extraction happens in a private staging directory next to the cache which is renamed
     * into place on success, so the cache path is either absent or complete. On failure the
     * staging directory is removed and dependency_fetch_failure is thrown.
     */
    std::filesystem::path populate_stdlib_cache(
            const stdlib_environment& env, const stdlib_settings& settings, archive_fetcher& fetcher);

    // Extracts entries below `dirname/` (at any depth of the archive) into dest; returns the file count
    size_t extract_library_subtree(
            std::span<const uint8_t> archive_bytes, const std::filesystem::path& dest, std::string_view dirname);

}  // namespace systree
