#pragma once

#include "systree/systree.hpp"

#include <catch2/catch_test_macros.hpp>

#include <zlib.h>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace systree::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static std::atomic<unsigned> counter{0};
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_bytes(const fs::path& path, std::string_view bytes) {
        if (auto parent = path.parent_path(); !parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        REQUIRE(out.good());
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        REQUIRE(out.good());
    }

    inline std::string read_bytes(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline std::vector<std::string> read_lines(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());

        std::vector<std::string> lines{};
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_bytes(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline size_t count_files(const fs::path& root) {
        size_t n = 0;
        for (const auto& item : fs::recursive_directory_iterator{root}) {
            if (item.is_regular_file()) {
                ++n;
            }
        }
        return n;
    }

    inline bool has_arg(const std::vector<std::string>& args, std::string_view token) {
        return std::ranges::find(args, token) != args.end();
    }

    /*
     * Stand-in for the engine: a shell script that records its arguments one per line,
     * replays canned stdout/stderr byte for byte and exits with a fixed status.
     */
    struct fake_engine {
        fs::path bin_dir{};
        fs::path binary{};
        fs::path args_file{};
        fs::path stdout_file{};
        fs::path stderr_file{};

        fake_engine(const fs::path& root, std::string_view name = "syster")
                : bin_dir(root / "bin"),
                  binary(bin_dir / name),
                  args_file(root / "engine.args"),
                  stdout_file(root / "engine.stdout"),
                  stderr_file(root / "engine.stderr") {
            fs::create_directories(bin_dir);
        }

        void install(std::string_view stdout_bytes, std::string_view stderr_bytes = {}, int exit_code = 0,
                     std::optional<int> sleep_seconds = std::nullopt) const {
            write_bytes(stdout_file, stdout_bytes);
            write_bytes(stderr_file, stderr_bytes);

            std::ostringstream script{};
            script << "#!/bin/sh\n";
            script << "printf '%s\\n' \"$@\" > '" << args_file.string() << "'\n";
            if (sleep_seconds) {
                script << "sleep " << *sleep_seconds << '\n';
            }
            script << "cat '" << stdout_file.string() << "'\n";
            script << "cat '" << stderr_file.string() << "' >&2\n";
            script << "exit " << exit_code << '\n';
            make_executable_file(binary, script.str());
        }

        bool was_run() const { return fs::exists(args_file); }

        std::vector<std::string> args() const { return read_lines(args_file); }
    };

    // Minimal ZIP writer for test archives: stored and raw-deflate entries, no zip64
    class zip_builder {
      public:
        zip_builder& add(std::string name, std::string_view content, bool compress = false) {
            pending.push_back(pending_entry{std::move(name), std::string{content}, compress});
            return *this;
        }

        zip_builder& add_directory(std::string name) {
            pending.push_back(pending_entry{std::move(name), std::string{}, false});
            return *this;
        }

        std::vector<uint8_t> build() const {
            std::vector<uint8_t> out{};
            std::vector<uint8_t> central{};

            for (const auto& item : pending) {
                auto crc = ::crc32(0L, Z_NULL, 0);
                if (!item.content.empty()) {
                    crc = ::crc32(
                            crc, reinterpret_cast<const Bytef*>(item.content.data()),
                            static_cast<uInt>(item.content.size()));
                }
                auto payload = item.compress ? deflate_raw(item.content) : item.content;
                uint16_t method = item.compress ? 8U : 0U;
                auto offset = static_cast<uint32_t>(out.size());

                put_u32(out, 0x04034b50U);
                put_u16(out, 20U);
                put_u16(out, 0U);
                put_u16(out, method);
                put_u16(out, 0U);
                put_u16(out, 0U);
                put_u32(out, static_cast<uint32_t>(crc));
                put_u32(out, static_cast<uint32_t>(payload.size()));
                put_u32(out, static_cast<uint32_t>(item.content.size()));
                put_u16(out, static_cast<uint16_t>(item.name.size()));
                put_u16(out, 0U);
                out.insert(out.end(), item.name.begin(), item.name.end());
                out.insert(out.end(), payload.begin(), payload.end());

                put_u32(central, 0x02014b50U);
                put_u16(central, 20U);
                put_u16(central, 20U);
                put_u16(central, 0U);
                put_u16(central, method);
                put_u16(central, 0U);
                put_u16(central, 0U);
                put_u32(central, static_cast<uint32_t>(crc));
                put_u32(central, static_cast<uint32_t>(payload.size()));
                put_u32(central, static_cast<uint32_t>(item.content.size()));
                put_u16(central, static_cast<uint16_t>(item.name.size()));
                put_u16(central, 0U);
                put_u16(central, 0U);
                put_u16(central, 0U);
                put_u16(central, 0U);
                put_u32(central, 0U);
                put_u32(central, offset);
                central.insert(central.end(), item.name.begin(), item.name.end());
            }

            auto central_offset = static_cast<uint32_t>(out.size());
            out.insert(out.end(), central.begin(), central.end());

            put_u32(out, 0x06054b50U);
            put_u16(out, 0U);
            put_u16(out, 0U);
            put_u16(out, static_cast<uint16_t>(pending.size()));
            put_u16(out, static_cast<uint16_t>(pending.size()));
            put_u32(out, static_cast<uint32_t>(central.size()));
            put_u32(out, central_offset);
            put_u16(out, 0U);
            return out;
        }

      private:
        struct pending_entry {
            std::string name{};
            std::string content{};
            bool compress{false};
        };

        static void put_u16(std::vector<uint8_t>& out, uint16_t value) {
            out.push_back(static_cast<uint8_t>(value & 0xFFU));
            out.push_back(static_cast<uint8_t>((value >> 8U) & 0xFFU));
        }

        static void put_u32(std::vector<uint8_t>& out, uint32_t value) {
            for (int shift = 0; shift < 32; shift += 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFFU));
            }
        }

        static std::string deflate_raw(const std::string& input) {
            z_stream stream{};
            if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
                throw std::runtime_error("deflateInit2 failed");
            }
            std::string output(deflateBound(&stream, static_cast<uLong>(input.size())), '\0');
            stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
            stream.avail_in = static_cast<uInt>(input.size());
            stream.next_out = reinterpret_cast<Bytef*>(output.data());
            stream.avail_out = static_cast<uInt>(output.size());
            auto ret = deflate(&stream, Z_FINISH);
            output.resize(stream.total_out);
            deflateEnd(&stream);
            if (ret != Z_STREAM_END) {
                throw std::runtime_error("deflate failed");
            }
            return output;
        }

        std::vector<pending_entry> pending{};
    };

    // Release archive layout: the library sits one directory below the archive root
    inline std::vector<uint8_t> make_release_archive() {
        return zip_builder{}
                .add_directory("SysML-v2-Release-2025-02/")
                .add("SysML-v2-Release-2025-02/README.md", "release notes\n")
                .add_directory("SysML-v2-Release-2025-02/sysml.library/")
                .add("SysML-v2-Release-2025-02/sysml.library/Kernel Libraries/Base.kerml",
                     "standard library package Base {}\n",
                     true)
                .add("SysML-v2-Release-2025-02/sysml.library/Systems Library/Parts.sysml",
                     "standard library package Parts {}\n")
                .add("SysML-v2-Release-2025-02/sysml.library/Domain Libraries/Quantities/ISQ.sysml",
                     std::string(4096, 'q'),
                     true)
                .build();
    }

    inline constexpr size_t release_library_files = 3U;

    // Serves canned archive bytes from memory and counts requests
    class counting_fetcher final : public archive_fetcher {
      public:
        explicit counting_fetcher(std::vector<uint8_t> payload, std::chrono::milliseconds delay = {})
                : payload(std::move(payload)), delay(delay) {}

        std::vector<uint8_t> fetch(const std::string& url, int) override {
            ++calls;
            {
                std::lock_guard lock{mutex};
                last_url = url;
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            if (fail) {
                throw std::runtime_error("connection refused");
            }
            return payload;
        }

        std::atomic<int> calls{0};
        bool fail{false};
        std::string last_url{};

      private:
        std::vector<uint8_t> payload{};
        std::chrono::milliseconds delay{};
        std::mutex mutex{};
    };

    inline stdlib_environment isolated_stdlib_env(const fs::path& root) {
        stdlib_environment env{};
        env.cache_root = root / "cache";
        env.working_dir = root / "work";
        fs::create_directories(env.working_dir);
        return env;
    }

    template <typename F>
    std::optional<error> capture_error(F&& fn) {
        try {
            std::forward<F>(fn)();
        } catch (const error& e) {
            return e;
        }
        return std::nullopt;
    }

}  // namespace systree::test::detail
