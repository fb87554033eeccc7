#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace systree {

    /*
     * One diagnostic record reported by the engine.
     *
     * The well-known fields are lifted out of the record when present; `raw` keeps the
     * record's JSON text verbatim so engine-specific fields survive.
     */
    struct diagnostic {
        std::string severity{};
        std::string message{};
        std::optional<std::string> file{};
        std::optional<uint64_t> line{};
        std::optional<uint64_t> column{};
        std::optional<std::string> code{};
        std::string raw{};
    };

    struct analysis_result {
        uint64_t file_count{};
        uint64_t symbol_count{};
        uint64_t error_count{};
        uint64_t warning_count{};
        std::vector<diagnostic> diagnostics{};
    };

    // Named element discovered in a source file; positions are 1-based
    struct symbol {
        std::string name{};
        std::string qualified_name{};
        std::string kind{};
        std::optional<std::string> file{};
        std::optional<uint64_t> start_line{};
        std::optional<uint64_t> start_col{};
        std::optional<uint64_t> end_line{};
        std::optional<uint64_t> end_col{};
        std::vector<std::string> supertypes{};
    };

    // Symbols are kept in the engine's emission order
    struct file_symbols {
        std::string path{};
        std::vector<symbol> symbols{};
    };

}  // namespace systree
