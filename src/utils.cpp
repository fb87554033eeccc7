#include "systree/utils.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace systree::utils {

    namespace {
        constexpr std::string_view replacement_character = "\xEF\xBF\xBD";

        constexpr bool is_continuation(unsigned char c) { return (c & 0xC0U) == 0x80U; }
    }  // namespace

    std::string decode_utf8_lossy(std::string_view bytes) {
        std::string out{};
        out.reserve(bytes.size());

        size_t i = 0;
        while (i < bytes.size()) {
            auto lead = static_cast<unsigned char>(bytes[i]);
            if (lead < 0x80U) {
                out.push_back(static_cast<char>(lead));
                ++i;
                continue;
            }

            size_t length = 0;
            uint32_t min_code = 0;
            if ((lead & 0xE0U) == 0xC0U) {
                length = 2;
                min_code = 0x80U;
            }
            else if ((lead & 0xF0U) == 0xE0U) {
                length = 3;
                min_code = 0x800U;
            }
            else if ((lead & 0xF8U) == 0xF0U) {
                length = 4;
                min_code = 0x10000U;
            }

            if (length == 0 || i + length > bytes.size()) {
                out.append(replacement_character);
                ++i;
                continue;
            }

            uint32_t code = lead & (0xFFU >> (length + 1U));
            bool valid = true;
            for (size_t k = 1; k < length; ++k) {
                auto c = static_cast<unsigned char>(bytes[i + k]);
                if (!is_continuation(c)) {
                    valid = false;
                    break;
                }
                code = (code << 6U) | (c & 0x3FU);
            }

            // overlong forms, surrogates and values past U+10FFFF are rejected
            if (!valid || code < min_code || code > 0x10FFFFU || (code >= 0xD800U && code <= 0xDFFFU)) {
                out.append(replacement_character);
                ++i;
                continue;
            }

            out.append(bytes.substr(i, length));
            i += length;
        }
        return out;
    }

}  // namespace systree::utils
