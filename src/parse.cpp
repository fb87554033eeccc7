#include "systree/parse.hpp"

#include "systree/errors.hpp"
#include "systree/format.hpp"
#include "systree/utils.hpp"

#include "internal/json.hpp"

#include <glaze/glaze.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace systree::literals;

namespace systree {

    namespace detail {

        struct count_pattern {
            std::string_view lead{};
            std::string_view first_unit{};
            std::string_view separator{};
            std::string_view second_unit{};
        };

        inline constexpr count_pattern analysis_pattern{
                .lead = "Analyzed "sv, .first_unit = " file"sv, .separator = ": "sv, .second_unit = " symbol"sv};

        inline constexpr count_pattern import_pattern{
                .lead = "Imported "sv,
                .first_unit = " element"sv,
                .separator = ", "sv,
                .second_unit = " relationship"sv};

        // Matches "<lead><N><first_unit>[s]<separator><M><second_unit>" at the start of `text`
        static std::optional<std::pair<uint64_t, uint64_t>> match_at(
                std::string_view text, const count_pattern& pattern) {
            text.remove_prefix(pattern.lead.size());

            auto first = utils::digit_run(text);
            if (first.empty()) {
                return std::nullopt;
            }
            text.remove_prefix(first.size());

            if (!text.starts_with(pattern.first_unit)) {
                return std::nullopt;
            }
            text.remove_prefix(pattern.first_unit.size());
            if (text.starts_with('s')) {
                text.remove_prefix(1);
            }

            if (!text.starts_with(pattern.separator)) {
                return std::nullopt;
            }
            text.remove_prefix(pattern.separator.size());

            auto second = utils::digit_run(text);
            if (second.empty()) {
                return std::nullopt;
            }
            text.remove_prefix(second.size());

            if (!text.starts_with(pattern.second_unit)) {
                return std::nullopt;
            }

            auto first_value = utils::parse_arithmetic<uint64_t>(first);
            auto second_value = utils::parse_arithmetic<uint64_t>(second);
            if (!first_value || !second_value) {
                return std::nullopt;
            }
            return std::pair{*first_value, *second_value};
        }

        static std::optional<std::pair<uint64_t, uint64_t>> search(std::string_view text, const count_pattern& pattern) {
            for (auto pos = text.find(pattern.lead); pos != std::string_view::npos;
                 pos = text.find(pattern.lead, pos + 1U)) {
                if (auto counts = match_at(text.substr(pos), pattern)) {
                    return counts;
                }
            }
            return std::nullopt;
        }

    }  // namespace detail

    std::optional<analysis_result> match_analysis_summary(std::string_view text) {
        auto counts = detail::search(text, detail::analysis_pattern);
        if (!counts) {
            return std::nullopt;
        }
        return analysis_result{.file_count = counts->first, .symbol_count = counts->second};
    }

    std::optional<analysis_result> match_import_summary(std::string_view text) {
        auto counts = detail::search(text, detail::import_pattern);
        if (!counts) {
            return std::nullopt;
        }
        return analysis_result{.file_count = 1U, .symbol_count = counts->first};
    }

    analysis_result parse_analysis_output(
            std::string_view stdout_text, std::string_view stderr_text, summary_kind kind) {
        if (auto decoded = internal::json::decode(stdout_text)) {
            if (!decoded->is_object()) {
                throw errors::parse_failed(
                        "engine output (JSON is not an object)", std::string{stdout_text}, std::string{stderr_text});
            }
            try {
                return internal::json::analysis_from_object(decoded->get_object());
            } catch (const internal::json::shape_error& e) {
                throw errors::parse_failed(
                        "engine output ({})"_format(e.what()), std::string{stdout_text}, std::string{stderr_text});
            }
        }

        if (auto result = match_analysis_summary(stdout_text)) {
            debug_log("summary line matched: ", result->file_count, " files, ", result->symbol_count, " symbols");
            return *result;
        }
        if (kind == summary_kind::import) {
            if (auto result = match_import_summary(stdout_text)) {
                debug_log("import summary matched: ", result->symbol_count, " elements");
                return *result;
            }
        }

        throw errors::parse_failed("engine output", std::string{stdout_text}, std::string{stderr_text});
    }

    std::vector<file_symbols> normalize_symbols(std::string_view json_text, std::string_view stderr_text) {
        auto decoded = internal::json::decode(json_text);
        if (!decoded) {
            throw errors::parse_failed(
                    "symbol payload (invalid JSON)", std::string{json_text}, std::string{stderr_text});
        }
        try {
            return internal::json::normalize_symbol_payload(*decoded);
        } catch (const internal::json::shape_error& e) {
            throw errors::parse_failed(
                    "symbol payload ({})"_format(e.what()), std::string{json_text}, std::string{stderr_text});
        }
    }

    void validate_json_document(std::string_view json_text, std::string_view stderr_text, std::string_view what) {
        auto decoded = internal::json::decode(json_text);
        if (!decoded) {
            throw errors::parse_failed("{} (invalid JSON)"_format(what), std::string{json_text}, std::string{stderr_text});
        }
        if (!decoded->is_array() && !decoded->is_object()) {
            throw errors::parse_failed(
                    "{} (expected a JSON array or object)"_format(what), std::string{json_text}, std::string{stderr_text});
        }
    }

}  // namespace systree
