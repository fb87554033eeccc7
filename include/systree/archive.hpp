#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace systree::archive {

    enum class compression : uint16_t {
        stored = 0,
        deflate = 8,
    };

    struct entry {
        std::string name{};
        uint16_t method{};
        uint32_t crc32{};
        uint64_t compressed_size{};
        uint64_t uncompressed_size{};
        uint64_t local_header_offset{};

        bool is_directory() const { return !name.empty() && name.back() == '/'; }
    };

    /*
     * Read-only view over an in-memory ZIP archive (KPAR exports, release archives).
     *
     * The central directory is parsed on construction; entry data is inflated on demand and
     * checked against the recorded CRC-32. Only stored and deflate members are supported; ZIP64
     * and encrypted archives are rejected. All failures throw std::runtime_error.
     *
     * The reader does not own the bytes; they must outlive it.
     */
    class zip_reader {
      public:
        explicit zip_reader(std::span<const uint8_t> bytes);

        const std::vector<entry>& entries() const { return items; }

        const entry* find(std::string_view name) const;

        std::vector<uint8_t> read(const entry& item) const;
        std::string read_text(std::string_view name) const;

      private:
        std::span<const uint8_t> data{};
        std::vector<entry> items{};
    };

    bool looks_like_zip(std::span<const uint8_t> bytes);

    std::vector<std::string> list_entries(std::span<const uint8_t> bytes);

}  // namespace systree::archive
