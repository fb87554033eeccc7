#include "systree/archive.hpp"

#include "systree/format.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace systree::literals;

namespace systree::archive {

    namespace detail {

        inline constexpr uint32_t local_header_sig = 0x04034b50U;
        inline constexpr uint32_t central_header_sig = 0x02014b50U;
        inline constexpr uint32_t end_of_central_dir_sig = 0x06054b50U;

        inline constexpr size_t local_header_size = 30U;
        inline constexpr size_t central_header_size = 46U;
        inline constexpr size_t end_of_central_dir_size = 22U;
        inline constexpr size_t max_comment_size = 0xFFFFU;

        inline constexpr uint16_t flag_encrypted = 0x0001U;

        static uint16_t read_u16(const uint8_t* p) {
            return static_cast<uint16_t>(p[0] | (p[1] << 8U));
        }

        static uint32_t read_u32(const uint8_t* p) {
            return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8U) |
                   (static_cast<uint32_t>(p[2]) << 16U) | (static_cast<uint32_t>(p[3]) << 24U);
        }

        [[noreturn]] static void malformed(std::string_view reason) {
            throw std::runtime_error("malformed zip archive: {}"_format(reason));
        }

        static void require_range(std::span<const uint8_t> data, uint64_t offset, uint64_t length, std::string_view what) {
            if (offset > data.size() || length > data.size() - offset) {
                malformed("{} out of bounds"_format(what));
            }
        }

        static size_t find_end_of_central_dir(std::span<const uint8_t> data) {
            if (data.size() < end_of_central_dir_size) {
                malformed("too small");
            }
            auto lowest = data.size() > end_of_central_dir_size + max_comment_size
                                ? data.size() - end_of_central_dir_size - max_comment_size
                                : size_t{0};
            for (auto pos = data.size() - end_of_central_dir_size + 1U; pos-- > lowest;) {
                if (read_u32(data.data() + pos) == end_of_central_dir_sig) {
                    return pos;
                }
            }
            malformed("end of central directory not found");
        }

        static std::vector<uint8_t> inflate_raw(std::span<const uint8_t> input, uint64_t expected_size) {
            if (expected_size > std::numeric_limits<uInt>::max() || input.size() > std::numeric_limits<uInt>::max()) {
                malformed("entry too large");
            }

            // zlib refuses a null next_out, so an empty entry still gets one byte to inflate into
            std::vector<uint8_t> output(std::max<size_t>(static_cast<size_t>(expected_size), 1U));

            z_stream stream{};
            // negative window bits: raw deflate data without zlib header
            if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
                throw std::runtime_error("inflateInit2 failed");
            }

            stream.next_in = const_cast<Bytef*>(input.data());
            stream.avail_in = static_cast<uInt>(input.size());
            stream.next_out = output.data();
            stream.avail_out = static_cast<uInt>(output.size());

            auto ret = inflate(&stream, Z_FINISH);
            auto produced = stream.total_out;
            inflateEnd(&stream);

            if (ret != Z_STREAM_END) {
                malformed("inflate failed ({})"_format(ret));
            }
            if (produced != expected_size) {
                malformed("inflated size mismatch");
            }
            output.resize(static_cast<size_t>(expected_size));
            return output;
        }

    }  // namespace detail

    zip_reader::zip_reader(std::span<const uint8_t> bytes) : data(bytes) {
        auto eocd = detail::find_end_of_central_dir(data);
        const auto* p = data.data() + eocd;

        auto entry_count = detail::read_u16(p + 10);
        auto dir_size = detail::read_u32(p + 12);
        auto dir_offset = detail::read_u32(p + 16);

        if (entry_count == 0xFFFFU || dir_offset == 0xFFFFFFFFU) {
            detail::malformed("zip64 archives are not supported");
        }
        detail::require_range(data, dir_offset, dir_size, "central directory");

        items.reserve(entry_count);
        auto pos = static_cast<size_t>(dir_offset);
        for (uint16_t i = 0; i < entry_count; ++i) {
            detail::require_range(data, pos, detail::central_header_size, "central directory entry");
            const auto* h = data.data() + pos;
            if (detail::read_u32(h) != detail::central_header_sig) {
                detail::malformed("bad central directory signature");
            }

            auto flags = detail::read_u16(h + 8);
            auto name_len = detail::read_u16(h + 28);
            auto extra_len = detail::read_u16(h + 30);
            auto comment_len = detail::read_u16(h + 32);

            detail::require_range(data, pos + detail::central_header_size, name_len, "entry name");

            entry item{};
            item.method = detail::read_u16(h + 10);
            item.crc32 = detail::read_u32(h + 16);
            item.compressed_size = detail::read_u32(h + 20);
            item.uncompressed_size = detail::read_u32(h + 24);
            item.local_header_offset = detail::read_u32(h + 42);
            item.name.assign(reinterpret_cast<const char*>(h + detail::central_header_size), name_len);

            if ((flags & detail::flag_encrypted) != 0U) {
                detail::malformed("encrypted entry '{}'"_format(item.name));
            }

            items.push_back(std::move(item));
            pos += detail::central_header_size + name_len + extra_len + comment_len;
        }
    }

    const entry* zip_reader::find(std::string_view name) const {
        auto it = std::ranges::find_if(items, [name](const entry& e) { return e.name == name; });
        return it == items.end() ? nullptr : &*it;
    }

    std::vector<uint8_t> zip_reader::read(const entry& item) const {
        detail::require_range(data, item.local_header_offset, detail::local_header_size, "local header");
        const auto* h = data.data() + item.local_header_offset;
        if (detail::read_u32(h) != detail::local_header_sig) {
            detail::malformed("bad local header signature for '{}'"_format(item.name));
        }

        // sizes in the local header may be zero (data descriptor); the central directory is authoritative
        auto name_len = detail::read_u16(h + 26);
        auto extra_len = detail::read_u16(h + 28);
        auto payload_offset = item.local_header_offset + detail::local_header_size + name_len + extra_len;
        detail::require_range(data, payload_offset, item.compressed_size, "entry data");

        auto payload = data.subspan(static_cast<size_t>(payload_offset), static_cast<size_t>(item.compressed_size));

        std::vector<uint8_t> content{};
        switch (static_cast<compression>(item.method)) {
            case compression::stored:
                if (item.compressed_size != item.uncompressed_size) {
                    detail::malformed("stored entry '{}' has mismatched sizes"_format(item.name));
                }
                content.assign(payload.begin(), payload.end());
                break;
            case compression::deflate:
                content = detail::inflate_raw(payload, item.uncompressed_size);
                break;
            default:
                detail::malformed("entry '{}' uses unsupported method {}"_format(item.name, item.method));
        }

        auto actual_crc = ::crc32(0L, Z_NULL, 0);
        if (!content.empty()) {
            actual_crc = ::crc32(actual_crc, content.data(), static_cast<uInt>(content.size()));
        }
        if (static_cast<uint32_t>(actual_crc) != item.crc32) {
            detail::malformed("crc mismatch for '{}'"_format(item.name));
        }
        return content;
    }

    std::string zip_reader::read_text(std::string_view name) const {
        const auto* item = find(name);
        if (item == nullptr) {
            throw std::runtime_error("zip archive has no entry '{}'"_format(name));
        }
        auto bytes = read(*item);
        return std::string{bytes.begin(), bytes.end()};
    }

    bool looks_like_zip(std::span<const uint8_t> bytes) {
        return bytes.size() >= 4U && bytes[0] == 'P' && bytes[1] == 'K' &&
               detail::read_u32(bytes.data()) == detail::local_header_sig;
    }

    std::vector<std::string> list_entries(std::span<const uint8_t> bytes) {
        zip_reader reader{bytes};
        std::vector<std::string> names{};
        names.reserve(reader.entries().size());
        for (const auto& item : reader.entries()) {
            names.push_back(item.name);
        }
        return names;
    }

}  // namespace systree::archive
