#include "systree/stdlib.hpp"

#include "systree/archive.hpp"
#include "systree/errors.hpp"
#include "systree/format.hpp"
#include "systree/utils.hpp"

#include "internal/platform.hpp"
#include "internal/process.hpp"

extern "C" {
#include <stdlib.h>
}

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using namespace systree::literals;

namespace systree {

    namespace detail {

        // CURLE_OPERATION_TIMEDOUT: curl gave up at --max-time
        inline constexpr int curl_operation_timedout = 28;

        static std::optional<std::string> get_env(std::string_view name) {
            const char* value = std::getenv(std::string{name}.c_str());
            if (value == nullptr) {
                return std::nullopt;
            }
            return std::string{value};
        }

        static bool is_directory(const fs::path& path) {
            std::error_code ec{};
            return fs::is_directory(path, ec) && !ec;
        }

        static bool is_populated_directory(const fs::path& path) {
            if (!is_directory(path)) {
                return false;
            }
            std::error_code ec{};
            auto it = fs::directory_iterator{path, ec};
            return !ec && it != fs::directory_iterator{};
        }

        // Removes the staging directory unless released
        class staging_dir {
          public:
            explicit staging_dir(fs::path dir) : path_value(std::move(dir)) {}

            staging_dir(const staging_dir&) = delete;
            staging_dir& operator=(const staging_dir&) = delete;

            ~staging_dir() {
                if (!released) {
                    std::error_code ec{};
                    fs::remove_all(path_value, ec);
                }
            }

            const fs::path& path() const { return path_value; }
            void release() { released = true; }

          private:
            fs::path path_value{};
            bool released{false};
        };

        static fs::path make_staging_dir(const fs::path& parent, std::string_view prefix) {
            auto pattern = (parent / "{}.staging-XXXXXX"_format(prefix)).string();
            std::vector<char> buffer{pattern.begin(), pattern.end()};
            buffer.push_back('\0');
            if (::mkdtemp(buffer.data()) == nullptr) {
                throw std::system_error{errno, std::generic_category(), "mkdtemp failed for {}"_format(pattern)};
            }
            return fs::path{buffer.data()};
        }

        // Path of `name` relative to the first `dirname/` component, or empty if outside it
        static std::string_view relative_to_library(std::string_view name, std::string_view dirname) {
            std::string marker{dirname};
            marker.push_back('/');

            size_t pos = 0;
            for (;;) {
                if (name.substr(pos).starts_with(marker)) {
                    return name.substr(pos + marker.size());
                }
                auto slash = name.find('/', pos);
                if (slash == std::string_view::npos) {
                    return {};
                }
                pos = slash + 1U;
            }
        }

        static bool is_safe_relative(const fs::path& rel) {
            if (rel.empty() || rel.is_absolute() || rel.has_root_name()) {
                return false;
            }
            for (const auto& part : rel) {
                if (part == "..") {
                    return false;
                }
            }
            return true;
        }

        static void write_file(const fs::path& path, const std::vector<uint8_t>& bytes) {
            std::ofstream out{path, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw std::runtime_error("failed to open {} for write"_format(path.string()));
            }
            out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (!out) {
                throw std::runtime_error("failed to write {}"_format(path.string()));
            }
        }

    }  // namespace detail

    stdlib_environment stdlib_environment::from_process() {
        stdlib_environment env{};
        env.env_override = detail::get_env(defaults::stdlib_env_var);

        if (auto xdg = detail::get_env(internal::platform::env::xdg_cache_home); xdg && !xdg->empty()) {
            env.cache_root = fs::path{*xdg} / defaults::cache_subdir;
        }
        else if (auto home = detail::get_env(internal::platform::env::home); home && !home->empty()) {
            env.cache_root = fs::path{*home} / ".cache" / defaults::cache_subdir;
        }
        else {
            env.cache_root = fs::temp_directory_path() / defaults::cache_subdir;
        }

        std::error_code ec{};
        env.working_dir = fs::current_path(ec);

        if (auto self = internal::platform::resolve_self_exe(); !self.empty()) {
            env.install_dir = self.parent_path();
        }
        return env;
    }

    std::vector<uint8_t> curl_fetcher::fetch(const std::string& url, int timeout_ms) {
        auto curl = internal::find_executable(
                curl_path.string(), detail::get_env(internal::platform::env::path).value_or(std::string{}));
        if (!curl) {
            throw errors::fetch_failed(url, "curl not found on PATH");
        }

        auto max_time = std::to_string(std::max(1, timeout_ms / 1000));
        std::vector<std::string> args{curl->string(), "-fsSL", "--proto", "=https", "--max-time", max_time, url};
        debug_log("fetching ", url);

        internal::subprocess_result proc{};
        try {
            // curl enforces max-time itself; the extra second covers process startup
            proc = internal::run_subprocess(args, timeout_ms + 1'000);
        } catch (const internal::spawn_error& e) {
            throw errors::fetch_failed(url, e.what());
        }

        if (proc.timed_out || proc.exit_code == detail::curl_operation_timedout) {
            throw errors::timed_out("download of {}"_format(url), timeout_ms);
        }
        if (proc.exit_code != 0) {
            auto reason = utils::trim_ascii(proc.stderr_output);
            throw errors::fetch_failed(
                    url, "curl exited with {}: {}"_format(proc.exit_code, utils::decode_utf8_lossy(reason)));
        }
        return std::vector<uint8_t>{proc.stdout_output.begin(), proc.stdout_output.end()};
    }

    fs::path stdlib_cache_dir(const stdlib_environment& env, const stdlib_settings& settings) {
        return env.cache_root / "{}-{}"_format(settings.dirname, settings.version);
    }

    std::optional<stdlib_location> find_stdlib(
            const std::optional<fs::path>& override_path,
            const stdlib_environment& env,
            const stdlib_settings& settings) {
        if (override_path) {
            return stdlib_location{.path = *override_path, .source = stdlib_source::explicit_path};
        }

        if (env.env_override && !env.env_override->empty()) {
            fs::path candidate{*env.env_override};
            if (detail::is_directory(candidate)) {
                return stdlib_location{.path = candidate, .source = stdlib_source::environment};
            }
            debug_log(defaults::stdlib_env_var, " ignored, not a directory: ", candidate.string());
        }

        if (auto cache = stdlib_cache_dir(env, settings); detail::is_populated_directory(cache)) {
            return stdlib_location{.path = cache, .source = stdlib_source::cache};
        }

        if (!env.working_dir.empty()) {
            if (auto local = env.working_dir / settings.dirname; detail::is_directory(local)) {
                return stdlib_location{.path = local, .source = stdlib_source::working_dir};
            }
        }

        if (env.install_dir) {
            if (auto sibling = env.install_dir->parent_path() / settings.dirname; detail::is_directory(sibling)) {
                return stdlib_location{.path = sibling, .source = stdlib_source::install_sibling};
            }
        }

        return std::nullopt;
    }

    stdlib_location resolve_stdlib(
            const std::optional<fs::path>& override_path,
            const stdlib_environment& env,
            const stdlib_settings& settings,
            archive_fetcher& fetcher) {
        if (auto found = find_stdlib(override_path, env, settings)) {
            debug_log("stdlib from ", to_string(found->source), ": ", found->path.string());
            return *found;
        }
        return stdlib_location{
                .path = populate_stdlib_cache(env, settings, fetcher), .source = stdlib_source::download};
    }

    size_t extract_library_subtree(
            std::span<const uint8_t> archive_bytes, const fs::path& dest, std::string_view dirname) {
        archive::zip_reader reader{archive_bytes};

        size_t files = 0;
        for (const auto& item : reader.entries()) {
            auto rel_name = detail::relative_to_library(item.name, dirname);
            if (rel_name.empty()) {
                continue;
            }

            fs::path rel{rel_name};
            if (!detail::is_safe_relative(rel)) {
                throw std::runtime_error("refusing to extract unsafe path '{}'"_format(item.name));
            }

            auto target = dest / rel;
            if (item.is_directory()) {
                fs::create_directories(target);
                continue;
            }

            fs::create_directories(target.parent_path());
            detail::write_file(target, reader.read(item));
            ++files;
        }
        return files;
    }

    fs::path populate_stdlib_cache(
            const stdlib_environment& env, const stdlib_settings& settings, archive_fetcher& fetcher) {
        auto cache = stdlib_cache_dir(env, settings);
        if (detail::is_populated_directory(cache)) {
            return cache;
        }

        auto url = settings.archive_url();

        std::error_code ec{};
        fs::create_directories(env.cache_root, ec);
        if (ec) {
            throw errors::fetch_failed(url, "cannot create cache root {}: {}"_format(env.cache_root.string(), ec.message()));
        }

        std::vector<uint8_t> archive_bytes{};
        try {
            archive_bytes = fetcher.fetch(url, settings.download_timeout_ms);
        } catch (const error&) {
            throw;
        } catch (const std::exception& e) {
            throw errors::fetch_failed(url, e.what());
        }

        detail::staging_dir staging{detail::make_staging_dir(env.cache_root, cache.filename().string())};
        debug_log("extracting ", archive_bytes.size(), " bytes into ", staging.path().string());

        size_t extracted = 0;
        try {
            extracted = extract_library_subtree(archive_bytes, staging.path(), settings.dirname);
        } catch (const std::exception& e) {
            throw errors::fetch_failed(url, "extraction failed: {}"_format(e.what()));
        }
        if (extracted == 0) {
            throw errors::fetch_failed(url, "archive contains no {}/ entries"_format(settings.dirname));
        }

        // an empty directory left at the cache path (e.g. by hand) would block the rename
        if (detail::is_directory(cache) && !detail::is_populated_directory(cache)) {
            fs::remove(cache, ec);
        }

        fs::rename(staging.path(), cache, ec);
        if (!ec) {
            staging.release();
            debug_log("stdlib cached at ", cache.string(), " (", extracted, " files)");
            return cache;
        }

        // another resolver promoted its copy first; ours is discarded by the guard
        if (detail::is_populated_directory(cache)) {
            debug_log("stdlib cache populated concurrently: ", cache.string());
            return cache;
        }
        throw errors::fetch_failed(url, "cannot move library into {}: {}"_format(cache.string(), ec.message()));
    }

}  // namespace systree
