#pragma once

#include "models.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace systree {

    // Which textual fallbacks apply when stdout is not JSON
    enum class summary_kind : uint8_t { analysis, import };

    // "Analyzed <N> file(s): <M> symbol(s)" anywhere in `text`
    std::optional<analysis_result> match_analysis_summary(std::string_view text);

    // "Imported <N> element(s), <M> relationship(s)"; elements map to symbol_count, file_count is 1
    std::optional<analysis_result> match_import_summary(std::string_view text);

    /*
     * Decodes the output of a counting operation (analyze, import).
     *
     * JSON is tried first. Text patterns are only consulted when stdout does not decode as
     * JSON at all; a decodable payload of the wrong shape is an output_parse_failure. Nothing
     * matching also throws output_parse_failure carrying both streams.
     */
    analysis_result parse_analysis_output(
            std::string_view stdout_text, std::string_view stderr_text, summary_kind kind = summary_kind::analysis);

    /*
     * Decodes an --export-ast payload into per-file symbol records.
     *
     * Accepts a list of file objects, a {"files": [...]} wrapper, or a single file object.
     * Order is preserved at both levels.
     */
    std::vector<file_symbols> normalize_symbols(std::string_view json_text, std::string_view stderr_text = {});

    // Throws output_parse_failure unless `json_text` decodes to an array or object
    void validate_json_document(std::string_view json_text, std::string_view stderr_text, std::string_view what);

}  // namespace systree
