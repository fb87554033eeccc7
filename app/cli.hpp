#pragma once

#include "systree/systree.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace systree::cli {

    enum class command_kind : uint8_t { analyze, symbols, export_model, import_model, decompile, roundtrip, stdlib };

    struct command_request {
        command_kind kind{command_kind::analyze};
        std::filesystem::path input{};
        std::optional<std::filesystem::path> output_file{};
        export_format format{export_format::xmi};
        roundtrip_format roundtrip{roundtrip_format::xmi};
        bool import_symbols{false};
        bool list_entries{false};
        bool find_only{false};
    };

    // Distinct process exit status per failure kind; 2 is reserved for usage errors
    int exit_code_for(error_kind kind);

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, command_request& request);
    int run_command(const startup_config& cfg, const command_request& request);

}  // namespace systree::cli
