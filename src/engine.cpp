#include "systree/engine.hpp"

#include "systree/format.hpp"
#include "systree/parse.hpp"
#include "systree/utils.hpp"

#include "internal/platform.hpp"
#include "internal/process.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace systree::literals;

namespace systree {

    namespace detail {

        static bool input_exists(const fs::path& path) {
            std::error_code ec{};
            return fs::exists(path, ec) && !ec;
        }

        static fs::path absolute_input(const fs::path& input) {
            std::error_code ec{};
            auto abs = fs::absolute(input, ec);
            return ec ? input : abs;
        }

        static std::string quote_for_log(const std::vector<std::string>& command) {
            return utils::join_with_separator(command, " ");
        }

        static std::vector<std::string> export_flags(std::string_view token) {
            return {"--export", std::string{token}};
        }

    }  // namespace detail

    engine_context engine_context::from_process() {
        engine_context ctx{};
        if (const char* path = std::getenv(std::string{internal::platform::env::path}.c_str())) {
            ctx.search_path = path;
        }
        ctx.stdlib_env = stdlib_environment::from_process();
        return ctx;
    }

    fs::path find_engine(std::string_view name, std::string_view search_path) {
        auto found = internal::find_executable(name, search_path);
        if (!found) {
            throw errors::binary_not_found(name, search_path);
        }
        debug_log("engine resolved: ", found->string());
        return *found;
    }

    std::vector<std::string> build_command(
            const fs::path& binary,
            const run_options& opts,
            const std::optional<fs::path>& stdlib_dir,
            const std::vector<std::string>& operation_flags,
            const fs::path& input) {
        std::vector<std::string> command{binary.string()};
        if (opts.verbose) {
            command.emplace_back("--verbose");
        }
        if (!opts.stdlib) {
            command.emplace_back("--no-stdlib");
        }
        else if (stdlib_dir) {
            command.emplace_back("--stdlib-path");
            command.push_back(stdlib_dir->string());
        }
        command.insert(command.end(), operation_flags.begin(), operation_flags.end());
        command.push_back(detail::absolute_input(input).string());
        return command;
    }

    invocation invoke(
            const engine_context& ctx,
            const fs::path& input,
            const std::vector<std::string>& operation_flags,
            transport_mode transport,
            const run_options& opts) {
        if (!detail::input_exists(input)) {
            throw errors::input_not_found(input);
        }

        auto binary = find_engine(ctx.engine, ctx.search_path);

        std::optional<fs::path> stdlib_dir{};
        if (opts.stdlib) {
            if (opts.stdlib_path) {
                stdlib_dir = opts.stdlib_path;
            }
            else {
                auto fetcher = ctx.fetcher;
                if (!fetcher) {
                    fetcher = std::make_shared<curl_fetcher>(fs::path{internal::platform::tool::curl});
                }
                stdlib_dir = resolve_stdlib(std::nullopt, ctx.stdlib_env, ctx.stdlib, *fetcher).path;
            }
        }

        invocation result{};
        result.command = build_command(binary, opts, stdlib_dir, operation_flags, input);
        debug_log("running [", to_string(transport), "]: ", detail::quote_for_log(result.command));

        internal::subprocess_result proc{};
        try {
            proc = internal::run_subprocess(result.command, opts.timeout_ms);
        } catch (const internal::spawn_error& e) {
            throw errors::spawn_failed(binary, e.code().message());
        }

        if (proc.timed_out) {
            throw errors::timed_out(
                    "{} {}"_format(ctx.engine, utils::join_with_separator(operation_flags, " ")),
                    opts.timeout_ms,
                    utils::decode_utf8_lossy(proc.stdout_output),
                    utils::decode_utf8_lossy(proc.stderr_output));
        }

        result.exit_code = proc.exit_code;
        result.stderr_text = utils::decode_utf8_lossy(proc.stderr_output);

        if (proc.exit_code != 0) {
            throw errors::process_failed(
                    proc.exit_code, utils::decode_utf8_lossy(proc.stdout_output), result.stderr_text);
        }

        switch (transport) {
            case transport_mode::text:
                result.stdout_text = utils::decode_utf8_lossy(proc.stdout_output);
                break;
            case transport_mode::binary:
                result.stdout_bytes.assign(proc.stdout_output.begin(), proc.stdout_output.end());
                break;
        }
        return result;
    }

    analysis_result analyze(const engine_context& ctx, const fs::path& path, const run_options& opts) {
        auto run = invoke(ctx, path, {"--json"}, transport_mode::text, opts);
        return parse_analysis_output(run.stdout_text, run.stderr_text, summary_kind::analysis);
    }

    std::vector<file_symbols> get_symbols(const engine_context& ctx, const fs::path& path, const run_options& opts) {
        auto run = invoke(ctx, path, {"--export-ast"}, transport_mode::text, opts);
        return normalize_symbols(run.stdout_text, run.stderr_text);
    }

    std::string export_xmi(const engine_context& ctx, const fs::path& path, const run_options& opts) {
        auto run = invoke(ctx, path, detail::export_flags(to_string(export_format::xmi)), transport_mode::text, opts);
        return std::move(run.stdout_text);
    }

    std::string export_jsonld(const engine_context& ctx, const fs::path& path, const run_options& opts) {
        auto run = invoke(
                ctx, path, detail::export_flags(to_string(export_format::json_ld)), transport_mode::text, opts);
        validate_json_document(run.stdout_text, run.stderr_text, "JSON-LD export");
        return std::move(run.stdout_text);
    }

    std::vector<uint8_t> export_kpar(const engine_context& ctx, const fs::path& path, const run_options& opts) {
        auto run = invoke(
                ctx, path, detail::export_flags(to_string(export_format::kpar)), transport_mode::binary, opts);
        return std::move(run.stdout_bytes);
    }

    analysis_result import_file(const engine_context& ctx, const fs::path& path, const run_options& opts) {
        auto run = invoke(ctx, path, {"--import", "--json"}, transport_mode::text, opts);
        return parse_analysis_output(run.stdout_text, run.stderr_text, summary_kind::import);
    }

    std::vector<file_symbols> import_symbols(const engine_context& ctx, const fs::path& path, const run_options& opts) {
        auto run = invoke(ctx, path, {"--import", "--export-ast"}, transport_mode::text, opts);
        return normalize_symbols(run.stdout_text, run.stderr_text);
    }

    std::string decompile(const engine_context& ctx, const fs::path& path, const run_options& opts) {
        auto run = invoke(ctx, path, {"--decompile"}, transport_mode::text, opts);
        return std::move(run.stdout_text);
    }

    std::vector<uint8_t> import_export(
            const engine_context& ctx, const fs::path& path, roundtrip_format format, const run_options& opts) {
        std::vector<std::string> flags{"--import-workspace"};
        auto exports = detail::export_flags(to_string(format));
        flags.insert(flags.end(), exports.begin(), exports.end());
        auto run = invoke(ctx, path, flags, transport_mode::binary, opts);
        return std::move(run.stdout_bytes);
    }

}  // namespace systree
