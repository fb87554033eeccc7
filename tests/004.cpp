#include "utils.hpp"

namespace systree::test {
    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    TEST_CASE("004: zip reader lists and reads stored and deflated entries", "[004][archive]") {
        std::string big(10'000, 'x');
        auto bytes = detail::zip_builder{}
                             .add("meta.json", R"({"name":"model"})")
                             .add_directory("models/")
                             .add("models/model.xmi", "<xmi:XMI>" + big + "</xmi:XMI>", true)
                             .add("empty.txt", "")
                             .build();

        REQUIRE(archive::looks_like_zip(bytes));

        archive::zip_reader reader{bytes};
        REQUIRE(reader.entries().size() == 4U);
        CHECK(reader.entries()[0].name == "meta.json");
        CHECK(reader.entries()[1].is_directory());
        CHECK(reader.entries()[2].method == static_cast<uint16_t>(archive::compression::deflate));
        CHECK(reader.entries()[2].compressed_size < reader.entries()[2].uncompressed_size);

        CHECK(reader.read_text("meta.json") == R"({"name":"model"})");
        CHECK(reader.read_text("models/model.xmi") == "<xmi:XMI>" + big + "</xmi:XMI>");
        CHECK(reader.read_text("empty.txt").empty());
        CHECK(reader.find("missing") == nullptr);
        CHECK_THROWS_AS(reader.read_text("missing"), std::runtime_error);

        auto names = archive::list_entries(bytes);
        CHECK(names == std::vector<std::string>{"meta.json", "models/", "models/model.xmi", "empty.txt"});
    }

    TEST_CASE("004: zip reader reads empty deflated entries", "[004][archive]") {
        auto bytes = detail::zip_builder{}
                             .add("model/empty.sysml", "", true)
                             .add("model/after.sysml", "package After;", true)
                             .build();

        archive::zip_reader reader{bytes};
        REQUIRE(reader.entries().size() == 2U);
        CHECK(reader.entries()[0].method == static_cast<uint16_t>(archive::compression::deflate));
        CHECK(reader.entries()[0].uncompressed_size == 0U);
        CHECK(reader.entries()[0].compressed_size > 0U);

        CHECK(reader.read_text("model/empty.sysml").empty());
        CHECK(reader.read_text("model/after.sysml") == "package After;");

        detail::temp_dir temp{"systree_empty_deflate"};
        auto library = detail::zip_builder{}
                               .add("r/sysml.library/Empty.sysml", "", true)
                               .add("r/sysml.library/Base.kerml", "package Base;", true)
                               .build();
        CHECK(extract_library_subtree(library, temp.path, "sysml.library") == 2U);
        CHECK(fs::exists(temp.path / "Empty.sysml"));
        CHECK(fs::file_size(temp.path / "Empty.sysml") == 0U);
    }

    TEST_CASE("004: zip reader rejects malformed archives", "[004][archive]") {
        SECTION("not a zip") {
            std::string text{"<xmi:XMI/> definitely not an archive"};
            std::vector<uint8_t> bytes{text.begin(), text.end()};
            CHECK_FALSE(archive::looks_like_zip(bytes));
            CHECK_THROWS_AS(archive::zip_reader{bytes}, std::runtime_error);
        }

        SECTION("empty input") {
            std::vector<uint8_t> bytes{};
            CHECK_FALSE(archive::looks_like_zip(bytes));
            CHECK_THROWS_AS(archive::list_entries(bytes), std::runtime_error);
        }

        SECTION("truncated central directory") {
            auto bytes = detail::zip_builder{}.add("a.txt", "alpha").add("b.txt", "beta").build();
            // keep the end record but drop the bytes in front of it
            std::vector<uint8_t> truncated{bytes.end() - 22, bytes.end()};
            CHECK_THROWS_AS(archive::zip_reader{truncated}, std::runtime_error);
        }

        SECTION("corrupted payload fails the crc check") {
            auto bytes = detail::zip_builder{}.add("a.txt", "alpha").build();
            // local header (30) + name (5) puts the payload at 35
            bytes[35] = static_cast<uint8_t>('A');
            archive::zip_reader reader{bytes};
            CHECK_THROWS_AS(reader.read_text("a.txt"), std::runtime_error);
        }
    }

}  // namespace systree::test
