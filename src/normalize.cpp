#include "internal/json.hpp"

#include "systree/format.hpp"
#include "systree/utils.hpp"

#include <glaze/glaze.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace systree::literals;
using namespace std::string_view_literals;

namespace systree::internal::json {

    namespace detail {

        inline constexpr auto unknown_path = "unknown"sv;
        inline constexpr auto unknown_kind = "Unknown"sv;

        static const glz::generic::array_t* optional_array_field(
                const glz::generic::object_t& object, std::string_view key, std::string_view owner) {
            const auto* value = member(object, key);
            if (value == nullptr) {
                return nullptr;
            }
            if (!value->is_array()) {
                throw shape_error{"{} field '{}' is not an array"_format(owner, key)};
            }
            return &value->get_array();
        }

        static std::vector<std::string> string_list(const glz::generic::array_t& values, std::string_view owner) {
            std::vector<std::string> out{};
            out.reserve(values.size());
            for (const auto& value : values) {
                if (!value.is_string()) {
                    throw shape_error{"{} contains a non-string entry"_format(owner)};
                }
                out.push_back(value.get<std::string>());
            }
            return out;
        }

        static symbol symbol_from_value(const glz::generic& value, const std::string& file_path) {
            if (!value.is_object()) {
                throw shape_error{"symbol entry in '{}' is not an object"_format(file_path)};
            }
            const auto& object = value.get_object();

            symbol sym{};
            sym.name = optional_string_field(object, "name", "symbol").value_or(std::string{});
            sym.qualified_name = optional_string_field(object, "qualified_name", "symbol").value_or(sym.name);
            sym.kind = optional_string_field(object, "kind", "symbol").value_or(std::string{unknown_kind});
            if (sym.kind.empty()) {
                sym.kind = unknown_kind;
            }
            sym.file = file_path;
            sym.start_line = optional_count_field(object, "start_line", "symbol");
            sym.start_col = optional_count_field(object, "start_col", "symbol");
            sym.end_line = optional_count_field(object, "end_line", "symbol");
            sym.end_col = optional_count_field(object, "end_col", "symbol");
            if (const auto* supertypes = optional_array_field(object, "supertypes", "symbol")) {
                sym.supertypes = string_list(*supertypes, "symbol supertypes");
            }
            return sym;
        }

        static file_symbols file_from_value(const glz::generic& value) {
            if (!value.is_object()) {
                throw shape_error{"file entry is not an object"};
            }
            const auto& object = value.get_object();

            file_symbols file{};
            if (auto path = optional_string_field(object, "file", "file")) {
                file.path = std::move(*path);
            }
            else if (auto alt = optional_string_field(object, "path", "file")) {
                file.path = std::move(*alt);
            }
            if (file.path.empty()) {
                file.path = unknown_path;
            }

            if (const auto* symbols = optional_array_field(object, "symbols", "file")) {
                file.symbols.reserve(symbols->size());
                for (const auto& entry : *symbols) {
                    file.symbols.push_back(symbol_from_value(entry, file.path));
                }
            }
            return file;
        }

    }  // namespace detail

    analysis_result analysis_from_object(const glz::generic::object_t& object) {
        analysis_result result{};
        result.file_count = count_field(object, "file_count", "analysis");
        result.symbol_count = count_field(object, "symbol_count", "analysis");
        result.error_count = count_field(object, "error_count", "analysis");
        result.warning_count = count_field(object, "warning_count", "analysis");

        if (const auto* diagnostics = detail::optional_array_field(object, "diagnostics", "analysis")) {
            result.diagnostics.reserve(diagnostics->size());
            for (const auto& entry : *diagnostics) {
                result.diagnostics.push_back(diagnostic_from_value(entry));
            }
        }
        return result;
    }

    // Lenient: well-known fields of the wrong type are left unset, the record is kept in `raw`
    diagnostic diagnostic_from_value(const glz::generic& value) {
        diagnostic diag{};
        diag.raw = encode(value);

        if (value.is_string()) {
            diag.message = value.get<std::string>();
            return diag;
        }
        if (!value.is_object()) {
            return diag;
        }

        const auto& object = value.get_object();
        auto string_of = [&object](std::string_view key) -> std::optional<std::string> {
            const auto* field = member(object, key);
            if (field == nullptr || !field->is_string()) {
                return std::nullopt;
            }
            return field->get<std::string>();
        };
        auto count_of = [&object](std::string_view key) -> std::optional<uint64_t> {
            const auto* field = member(object, key);
            return field == nullptr ? std::nullopt : as_count(*field);
        };

        diag.severity = string_of("severity").value_or(std::string{});
        diag.message = string_of("message").value_or(std::string{});
        diag.file = string_of("file");
        if (!diag.file) {
            diag.file = string_of("path");
        }
        diag.line = count_of("line");
        diag.column = count_of("column");
        if (!diag.column) {
            diag.column = count_of("col");
        }

        if (const auto* code = member(object, "code")) {
            if (code->is_string()) {
                diag.code = code->get<std::string>();
            }
            else if (auto numeric = as_count(*code)) {
                diag.code = std::to_string(*numeric);
            }
        }
        return diag;
    }

    std::vector<file_symbols> normalize_symbol_payload(const glz::generic& payload) {
        glz::generic::array_t single{};
        const glz::generic::array_t* files = nullptr;

        if (payload.is_array()) {
            files = &payload.get_array();
        }
        else if (payload.is_object()) {
            const auto& object = payload.get_object();
            if (object.contains("files")) {
                // a null wrapper means no files, not a file object without a path
                files = detail::optional_array_field(object, "files", "payload");
                if (files == nullptr) {
                    return {};
                }
            }
            else {
                single.push_back(payload);
                files = &single;
            }
        }
        else {
            throw shape_error{"expected a JSON array or object"};
        }

        std::vector<file_symbols> out{};
        out.reserve(files->size());
        for (const auto& entry : *files) {
            out.push_back(detail::file_from_value(entry));
        }
        return out;
    }

}  // namespace systree::internal::json
