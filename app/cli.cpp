#include "cli.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace systree::literals;

namespace systree::cli {

    namespace detail {

        using namespace std::string_view_literals;
        namespace fs = std::filesystem;

        // On-disk form of --config; every key is optional and unknown keys are rejected
        struct config_file {
            std::optional<std::string> engine{};
            std::optional<std::string> search_path{};
            std::optional<int> timeout_ms{};
            std::optional<bool> verbose{};
            std::optional<bool> quiet{};
            std::optional<bool> stdlib_enabled{};
            std::optional<std::string> stdlib_path{};
            std::optional<std::string> stdlib_version{};
            std::optional<std::string> stdlib_url{};
            std::optional<std::string> cache_dir{};
            std::optional<int> download_timeout_ms{};
            std::optional<std::string> output{};
        };

        struct stdlib_record {
            std::string path{};
            std::string source{};
        };

        struct entries_record {
            std::vector<std::string> entries{};
        };

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static void write_bytes_file(const fs::path& path, std::string_view bytes) {
            std::ofstream out{path, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            if (!out) {
                throw std::runtime_error("failed to write {}"_format(path.string()));
            }
        }

        template <typename T>
        static std::string to_json(const T& value) {
            std::string json{};
            auto ec = glz::write_json(value, json);
            if (ec) {
                throw std::runtime_error("failed to serialize json output");
            }
            return json;
        }

        static void apply_config_file(const fs::path& path, startup_config& cfg) {
            config_file data{};
            auto json = read_text_file(path);
            auto ec = glz::read_json(data, json);
            if (ec) {
                throw std::runtime_error(
                        "failed to parse config file {}: {}"_format(path.string(), glz::format_error(ec, json)));
            }

            if (data.engine) {
                cfg.engine = *data.engine;
            }
            if (data.search_path) {
                cfg.search_path = data.search_path;
            }
            if (data.timeout_ms) {
                cfg.timeout_ms = *data.timeout_ms;
            }
            if (data.verbose) {
                cfg.verbose = *data.verbose;
            }
            if (data.quiet) {
                cfg.quiet = *data.quiet;
            }
            if (data.stdlib_enabled) {
                cfg.stdlib_enabled = *data.stdlib_enabled;
            }
            if (data.stdlib_path) {
                cfg.stdlib_path = fs::path{*data.stdlib_path};
            }
            if (data.stdlib_version) {
                cfg.stdlib_version = *data.stdlib_version;
            }
            if (data.stdlib_url) {
                cfg.stdlib_url = data.stdlib_url;
            }
            if (data.cache_dir) {
                cfg.cache_dir = fs::path{*data.cache_dir};
            }
            if (data.download_timeout_ms) {
                cfg.download_timeout_ms = *data.download_timeout_ms;
            }
            if (data.output && !try_parse_output_mode(*data.output, cfg.output)) {
                throw std::runtime_error(
                        "invalid output in {}: {} (expected table|json)"_format(path.string(), *data.output));
            }
        }

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "engine=" << cfg.engine << '\n';
            os << "search_path=" << (cfg.search_path ? *cfg.search_path : "<PATH>") << '\n';
            os << "timeout_ms=" << cfg.timeout_ms << '\n';
            os << "stdlib=" << (cfg.stdlib_enabled ? "enabled" : "disabled") << '\n';
            os << "stdlib_path=" << (cfg.stdlib_path ? cfg.stdlib_path->string() : "<resolve>") << '\n';
            os << "stdlib_version=" << cfg.stdlib_version << '\n';
            os << "stdlib_url=" << (cfg.stdlib_url ? *cfg.stdlib_url : "<default>") << '\n';
            os << "cache_dir=" << (cfg.cache_dir ? cfg.cache_dir->string() : "<default>") << '\n';
            os << "download_timeout_ms=" << cfg.download_timeout_ms << '\n';
            os << "output=" << to_string(cfg.output) << '\n';
        }

        static engine_context make_context(const startup_config& cfg) {
            auto ctx = engine_context::from_process();
            ctx.engine = cfg.engine;
            if (cfg.search_path) {
                ctx.search_path = *cfg.search_path;
            }
            if (cfg.cache_dir) {
                ctx.stdlib_env.cache_root = *cfg.cache_dir;
            }
            ctx.stdlib.version = cfg.stdlib_version;
            ctx.stdlib.url = cfg.stdlib_url;
            ctx.stdlib.download_timeout_ms = cfg.download_timeout_ms;
            return ctx;
        }

        static run_options make_options(const startup_config& cfg) {
            return run_options{
                    .verbose = cfg.verbose,
                    .stdlib = cfg.stdlib_enabled,
                    .stdlib_path = cfg.stdlib_path,
                    .timeout_ms = cfg.timeout_ms};
        }

        static void render_analysis(const analysis_result& result, output_mode mode, std::ostream& os) {
            if (mode == output_mode::json) {
                os << to_json(result) << '\n';
                return;
            }

            os << "files:    " << result.file_count << '\n';
            os << "symbols:  " << result.symbol_count << '\n';
            os << "errors:   " << result.error_count << '\n';
            os << "warnings: " << result.warning_count << '\n';
            for (const auto& diag : result.diagnostics) {
                os << "  " << (diag.severity.empty() ? "note"sv : std::string_view{diag.severity}) << ' ';
                if (diag.file) {
                    os << *diag.file;
                    if (diag.line) {
                        os << ':' << *diag.line;
                        if (diag.column) {
                            os << ':' << *diag.column;
                        }
                    }
                    os << ": ";
                }
                os << (diag.message.empty() ? diag.raw : diag.message) << '\n';
            }
        }

        static void render_symbols(const std::vector<file_symbols>& files, output_mode mode, std::ostream& os) {
            if (mode == output_mode::json) {
                os << to_json(files) << '\n';
                return;
            }

            for (const auto& file : files) {
                os << file.path << " (" << file.symbols.size() << " symbols)\n";
                for (const auto& sym : file.symbols) {
                    os << "  " << sym.kind << ' ' << sym.qualified_name;
                    if (sym.start_line) {
                        os << " @" << *sym.start_line;
                        if (sym.start_col) {
                            os << ':' << *sym.start_col;
                        }
                    }
                    if (!sym.supertypes.empty()) {
                        os << " : " << utils::join_with_separator(sym.supertypes, ", ");
                    }
                    os << '\n';
                }
            }
        }

        static void render_entries(std::span<const uint8_t> archive_bytes, output_mode mode, std::ostream& os) {
            auto names = archive::list_entries(archive_bytes);
            if (mode == output_mode::json) {
                os << to_json(entries_record{.entries = std::move(names)}) << '\n';
                return;
            }
            for (const auto& name : names) {
                os << name << '\n';
            }
        }

        // Text artifacts go to stdout unless -o is given; binary artifacts too, byte for byte
        static void emit_artifact(
                std::string_view bytes, const command_request& request, const startup_config& cfg) {
            if (request.output_file) {
                write_bytes_file(*request.output_file, bytes);
                if (!cfg.quiet) {
                    std::cerr << "wrote " << bytes.size() << " bytes to " << request.output_file->string() << '\n';
                }
                return;
            }
            std::cout.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            std::cout.flush();
        }

        static std::string_view as_chars(const std::vector<uint8_t>& bytes) {
            return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
        }

        static int run_stdlib_command(const startup_config& cfg, const command_request& request) {
            auto ctx = make_context(cfg);

            std::optional<stdlib_location> location{};
            if (request.find_only) {
                location = find_stdlib(cfg.stdlib_path, ctx.stdlib_env, ctx.stdlib);
                if (!location) {
                    if (!cfg.quiet) {
                        std::cerr << "standard library not found locally (expected at "
                                  << stdlib_cache_dir(ctx.stdlib_env, ctx.stdlib).string() << ")\n";
                    }
                    return 1;
                }
            }
            else {
                curl_fetcher fetcher{};
                location = resolve_stdlib(cfg.stdlib_path, ctx.stdlib_env, ctx.stdlib, fetcher);
            }

            if (cfg.output == output_mode::json) {
                std::cout << to_json(stdlib_record{
                                     .path = location->path.string(),
                                     .source = std::string{to_string(location->source)}})
                          << '\n';
            }
            else {
                std::cout << location->path.string() << " (" << to_string(location->source) << ")\n";
            }
            return 0;
        }

    }  // namespace detail

    int exit_code_for(error_kind kind) {
        switch (kind) {
            case error_kind::input_not_found:
                return 3;
            case error_kind::binary_not_found:
                return 4;
            case error_kind::dependency_fetch_failure:
                return 5;
            case error_kind::process_execution_failure:
                return 6;
            case error_kind::output_parse_failure:
                return 7;
            case error_kind::timeout:
                return 8;
        }
        return 1;
    }

    int run_command(const startup_config& cfg, const command_request& request) {
        if (request.kind == command_kind::stdlib) {
            return detail::run_stdlib_command(cfg, request);
        }

        auto ctx = detail::make_context(cfg);
        auto opts = detail::make_options(cfg);

        if (cfg.verbose && !cfg.quiet) {
            std::cerr << "engine: " << ctx.engine << ", input: " << request.input.string() << '\n';
        }

        switch (request.kind) {
            case command_kind::analyze:
                detail::render_analysis(analyze(ctx, request.input, opts), cfg.output, std::cout);
                break;
            case command_kind::symbols:
                detail::render_symbols(get_symbols(ctx, request.input, opts), cfg.output, std::cout);
                break;
            case command_kind::export_model:
                switch (request.format) {
                    case export_format::xmi:
                        detail::emit_artifact(export_xmi(ctx, request.input, opts), request, cfg);
                        break;
                    case export_format::json_ld:
                        detail::emit_artifact(export_jsonld(ctx, request.input, opts), request, cfg);
                        break;
                    case export_format::kpar: {
                        auto bytes = export_kpar(ctx, request.input, opts);
                        if (request.list_entries) {
                            detail::render_entries(bytes, cfg.output, std::cout);
                        }
                        else {
                            detail::emit_artifact(detail::as_chars(bytes), request, cfg);
                        }
                        break;
                    }
                }
                break;
            case command_kind::import_model:
                if (request.import_symbols) {
                    detail::render_symbols(import_symbols(ctx, request.input, opts), cfg.output, std::cout);
                }
                else {
                    detail::render_analysis(import_file(ctx, request.input, opts), cfg.output, std::cout);
                }
                break;
            case command_kind::decompile:
                detail::emit_artifact(decompile(ctx, request.input, opts), request, cfg);
                break;
            case command_kind::roundtrip:
                detail::emit_artifact(
                        detail::as_chars(import_export(ctx, request.input, request.roundtrip, opts)), request, cfg);
                break;
            case command_kind::stdlib:
                break;
        }
        return 0;
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, command_request& request) {
        CLI::App app{"systree: client for the syster SysML v2 engine"};
        app.require_subcommand(0, 1);

        bool show_version = false;
        bool no_stdlib = false;
        std::string config_arg{};
        std::string engine_arg{};
        std::string search_path_arg{};
        std::string stdlib_path_arg{};
        std::string cache_dir_arg{};
        std::string output_arg{};
        int timeout_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "JSON config file")->check(CLI::ExistingFile);
        app.add_option("--engine", engine_arg, "Engine executable name or path");
        app.add_option("--search-path", search_path_arg, "Directories searched for the engine (default: $PATH)");
        app.add_option("--timeout-ms", timeout_arg, "Wall-time budget per engine run")->check(CLI::PositiveNumber);
        app.add_flag("--no-stdlib", no_stdlib, "Do not load the standard library");
        app.add_option("--stdlib-path", stdlib_path_arg, "Standard library directory")->check(CLI::ExistingDirectory);
        app.add_option("--cache-dir", cache_dir_arg, "Standard library cache root");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", "Suppress non-essential output");
        app.add_flag("--verbose", "Enable verbose output");

        std::string input_arg{};
        std::string output_file_arg{};
        std::string format_arg{};

        auto* analyze_cmd = app.add_subcommand("analyze", "Analyze a model file or directory");
        analyze_cmd->add_option("input", input_arg, "Model file or directory")->required();

        auto* symbols_cmd = app.add_subcommand("symbols", "List symbols per file");
        symbols_cmd->add_option("input", input_arg, "Model file or directory")->required();

        auto* export_cmd = app.add_subcommand("export", "Export the model to an interchange format");
        export_cmd->add_option("input", input_arg, "Model file or directory")->required();
        export_cmd->add_option("-f,--format", format_arg, "xmi|json-ld|kpar")->required();
        export_cmd->add_option("-o,--out", output_file_arg, "Write the artifact to a file");
        export_cmd->add_flag("--list-entries", request.list_entries, "List KPAR archive entries instead of writing");

        auto* import_cmd = app.add_subcommand("import", "Import an interchange file (XMI, KPAR, JSON-LD)");
        import_cmd->add_option("input", input_arg, "Interchange file")->required();
        import_cmd->add_flag("--symbols", request.import_symbols, "List imported symbols instead of counts");

        auto* decompile_cmd = app.add_subcommand("decompile", "Decompile an interchange file to SysML text");
        decompile_cmd->add_option("input", input_arg, "Interchange file")->required();
        decompile_cmd->add_option("-o,--out", output_file_arg, "Write the text to a file");

        auto* roundtrip_cmd = app.add_subcommand("roundtrip", "Import an interchange file and re-export it");
        roundtrip_cmd->add_option("input", input_arg, "Interchange file")->required();
        roundtrip_cmd->add_option("-f,--format", format_arg, "xmi|kpar|jsonld")->required();
        roundtrip_cmd->add_option("-o,--out", output_file_arg, "Write the artifact to a file");

        auto* stdlib_cmd = app.add_subcommand("stdlib", "Resolve the standard library, downloading it if needed");
        stdlib_cmd->add_flag("--find-only", request.find_only, "Never download");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "systree " << version << '\n';
            return std::optional<int>{0};
        }

        // precedence: compiled defaults < --config file < command line
        if (!config_arg.empty()) {
            try {
                detail::apply_config_file(config_arg, cfg);
            } catch (const std::exception& e) {
                std::cerr << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        if (app.get_option("--engine")->count() > 0U) {
            cfg.engine = engine_arg;
        }
        if (app.get_option("--search-path")->count() > 0U) {
            cfg.search_path = search_path_arg;
        }
        if (app.get_option("--timeout-ms")->count() > 0U) {
            cfg.timeout_ms = timeout_arg;
        }
        if (app.get_option("--stdlib-path")->count() > 0U) {
            cfg.stdlib_path = std::filesystem::path{stdlib_path_arg};
        }
        if (app.get_option("--cache-dir")->count() > 0U) {
            cfg.cache_dir = std::filesystem::path{cache_dir_arg};
        }
        if (no_stdlib) {
            cfg.stdlib_enabled = false;
        }
        if (app.get_option("--quiet")->count() > 0U) {
            cfg.quiet = true;
        }
        if (app.get_option("--verbose")->count() > 0U) {
            cfg.verbose = true;
        }
        if (app.get_option("--output")->count() > 0U && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (analyze_cmd->parsed()) {
            request.kind = command_kind::analyze;
        }
        else if (symbols_cmd->parsed()) {
            request.kind = command_kind::symbols;
        }
        else if (export_cmd->parsed()) {
            request.kind = command_kind::export_model;
            if (!try_parse_export_format(format_arg, request.format)) {
                std::cerr << "invalid --format value: " << format_arg << " (expected xmi|json-ld|kpar)\n";
                return std::optional<int>{2};
            }
            if (request.list_entries && request.format != export_format::kpar) {
                std::cerr << "--list-entries requires --format kpar\n";
                return std::optional<int>{2};
            }
        }
        else if (import_cmd->parsed()) {
            request.kind = command_kind::import_model;
        }
        else if (decompile_cmd->parsed()) {
            request.kind = command_kind::decompile;
        }
        else if (roundtrip_cmd->parsed()) {
            request.kind = command_kind::roundtrip;
            if (!try_parse_roundtrip_format(format_arg, request.roundtrip)) {
                std::cerr << "invalid --format value: " << format_arg << " (expected xmi|kpar|jsonld)\n";
                return std::optional<int>{2};
            }
        }
        else if (stdlib_cmd->parsed()) {
            request.kind = command_kind::stdlib;
        }
        else {
            std::cerr << app.help();
            return std::optional<int>{2};
        }

        request.input = input_arg;
        if (!output_file_arg.empty()) {
            request.output_file = std::filesystem::path{output_file_arg};
        }
        return std::nullopt;
    }

}  // namespace systree::cli
