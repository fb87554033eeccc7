#pragma once

#include "systree/models.hpp"

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace systree::internal::json {

    // Reject trailing garbage so "42 files" is not read as the number 42
    struct strict_opts : glz::opts {
        bool validate_trailing_whitespace = true;
    };

    // Payload decoded but its shape is not one we accept
    struct shape_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    inline std::optional<glz::generic> decode(std::string_view text) {
        std::string buffer{text};
        glz::generic value{};
        auto ec = glz::read<strict_opts{}>(value, buffer);
        if (ec) {
            return std::nullopt;
        }
        return value;
    }

    inline std::string encode(const glz::generic& value) {
        std::string out{};
        auto ec = glz::write_json(value, out);
        if (ec) {
            throw std::runtime_error("failed to serialize json value");
        }
        return out;
    }

    // null counts as absent
    inline const glz::generic* member(const glz::generic::object_t& object, std::string_view key) {
        auto it = object.find(key);
        if (it == object.end() || it->second.is_null()) {
            return nullptr;
        }
        return &it->second;
    }

    // glz::generic holds numbers as double; past 2^53 integers no longer round-trip exactly
    inline constexpr double max_exact_count = 9007199254740992.0;

    inline std::optional<uint64_t> as_count(const glz::generic& value) {
        if (!value.is_number()) {
            return std::nullopt;
        }
        auto number = value.get<double>();
        if (!std::isfinite(number) || number < 0.0 || std::floor(number) != number || number > max_exact_count) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(number);
    }

    inline uint64_t count_field(const glz::generic::object_t& object, std::string_view key, std::string_view owner) {
        const auto* value = member(object, key);
        if (value == nullptr) {
            return 0U;
        }
        auto count = as_count(*value);
        if (!count) {
            throw shape_error{std::string{owner} + " field '" + std::string{key} + "' is not a non-negative integer"};
        }
        return *count;
    }

    inline std::optional<uint64_t> optional_count_field(
            const glz::generic::object_t& object, std::string_view key, std::string_view owner) {
        const auto* value = member(object, key);
        if (value == nullptr) {
            return std::nullopt;
        }
        auto count = as_count(*value);
        if (!count) {
            throw shape_error{std::string{owner} + " field '" + std::string{key} + "' is not a non-negative integer"};
        }
        return count;
    }

    inline std::optional<std::string> optional_string_field(
            const glz::generic::object_t& object, std::string_view key, std::string_view owner) {
        const auto* value = member(object, key);
        if (value == nullptr) {
            return std::nullopt;
        }
        if (!value->is_string()) {
            throw shape_error{std::string{owner} + " field '" + std::string{key} + "' is not a string"};
        }
        return value->get<std::string>();
    }

    analysis_result analysis_from_object(const glz::generic::object_t& object);

    diagnostic diagnostic_from_value(const glz::generic& value);

    // Canonicalizes the three accepted --export-ast shapes; throws shape_error otherwise
    std::vector<file_symbols> normalize_symbol_payload(const glz::generic& payload);

}  // namespace systree::internal::json
