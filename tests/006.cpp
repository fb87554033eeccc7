#include "utils.hpp"

#include "../src/internal/process.hpp"

namespace systree::test {
    using namespace std::string_view_literals;
    using namespace systree::literals;
    namespace fs = std::filesystem;

    TEST_CASE("006: engine lookup walks the search path in order", "[006][locator]") {
        detail::temp_dir temp{"systree_locator"};
        auto first = temp.path / "first";
        auto second = temp.path / "second";
        fs::create_directories(first);
        detail::make_executable_file(second / "syster", "#!/bin/sh\nexit 0\n");

        auto search_path = "{}:{}"_format(first.string(), second.string());
        CHECK(find_engine("syster", search_path) == second / "syster");

        detail::make_executable_file(first / "syster", "#!/bin/sh\nexit 0\n");
        CHECK(find_engine("syster", search_path) == first / "syster");

        SECTION("non-executable files are skipped") {
            fs::remove(first / "syster");
            detail::write_bytes(first / "syster", "not executable");
            CHECK(find_engine("syster", search_path) == second / "syster");
        }

        SECTION("directories are skipped") {
            fs::remove(first / "syster");
            fs::create_directories(first / "syster");
            CHECK(find_engine("syster", search_path) == second / "syster");
        }

        SECTION("names containing a slash are used as paths") {
            auto direct = (second / "syster").string();
            CHECK(find_engine(direct, ""sv) == second / "syster");
        }
    }

    TEST_CASE("006: missing engine raises binary_not_found", "[006][locator]") {
        detail::temp_dir temp{"systree_locator_missing"};

        auto err = detail::capture_error([&] { (void)find_engine("syster", temp.path.string()); });
        REQUIRE(err.has_value());
        CHECK(err->kind() == error_kind::binary_not_found);
        CHECK(std::string_view{err->what()}.find("syster not found") != std::string_view::npos);

        CHECK(detail::capture_error([] { (void)find_engine("syster", ""sv); }).has_value());
        CHECK(detail::capture_error([] { (void)find_engine("", "/usr/bin:/bin"sv); }).has_value());
    }

    TEST_CASE("006: command line layout", "[006][command]") {
        fs::path binary{"/opt/syster/bin/syster"};
        fs::path input{"/models/vehicle.sysml"};
        fs::path library{"/cache/sysml.library-2025-02"};

        SECTION("stdlib path and flags") {
            auto cmd = build_command(binary, run_options{}, library, {"--json"}, input);
            CHECK(cmd == std::vector<std::string>{
                                 "/opt/syster/bin/syster",
                                 "--stdlib-path",
                                 "/cache/sysml.library-2025-02",
                                 "--json",
                                 "/models/vehicle.sysml"});
        }

        SECTION("verbose precedes the library selection") {
            run_options opts{.verbose = true};
            auto cmd = build_command(binary, opts, library, {"--export", "xmi"}, input);
            REQUIRE(cmd.size() == 7U);
            CHECK(cmd[1] == "--verbose");
            CHECK(cmd[2] == "--stdlib-path");
            CHECK(cmd[4] == "--export");
            CHECK(cmd[5] == "xmi");
        }

        SECTION("disabled stdlib ignores any path") {
            run_options opts{.stdlib = false, .stdlib_path = library};
            auto cmd = build_command(binary, opts, library, {"--decompile"}, input);
            CHECK(cmd == std::vector<std::string>{
                                 "/opt/syster/bin/syster", "--no-stdlib", "--decompile", "/models/vehicle.sysml"});
        }

        SECTION("no library directory passes nothing") {
            auto cmd = build_command(binary, run_options{}, std::nullopt, {"--export-ast"}, input);
            CHECK(cmd == std::vector<std::string>{"/opt/syster/bin/syster", "--export-ast", "/models/vehicle.sysml"});
        }

        SECTION("relative input becomes absolute") {
            auto cmd = build_command(binary, run_options{}, std::nullopt, {"--json"}, "model.sysml");
            CHECK(fs::path{cmd.back()}.is_absolute());
            CHECK(cmd.back().ends_with("model.sysml"));
        }
    }

    TEST_CASE("006: subprocess runner captures both streams and the exit code", "[006][process]") {
        auto result = internal::run_subprocess(
                {"/bin/sh", "-c", "printf 'out\\000put'; printf 'err' >&2; exit 3"}, 5'000);
        CHECK_FALSE(result.timed_out);
        CHECK(result.exit_code == 3);
        CHECK(result.stdout_output == std::string{"out\0put", 7});
        CHECK(result.stderr_output == "err");
    }

    TEST_CASE("006: subprocess runner drains large output on both pipes", "[006][process]") {
        // more than a pipe buffer on each stream, interleaved
        auto result = internal::run_subprocess(
                {"/bin/sh", "-c", "i=0; while [ $i -lt 2000 ]; do echo 0123456789012345678901234567890123456789; "
                                  "echo abcdefghijabcdefghijabcdefghijabcdefghij >&2; i=$((i+1)); done"},
                20'000);
        CHECK_FALSE(result.timed_out);
        CHECK(result.exit_code == 0);
        CHECK(result.stdout_output.size() == 2000U * 41U);
        CHECK(result.stderr_output.size() == 2000U * 41U);
    }

    TEST_CASE("006: subprocess runner kills the child on timeout", "[006][process][timeout]") {
        auto start = std::chrono::steady_clock::now();
        auto result = internal::run_subprocess({"/bin/sh", "-c", "printf early; exec sleep 30"}, 300);
        auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK(result.timed_out);
        CHECK(result.stdout_output == "early");
        CHECK(elapsed < std::chrono::seconds{10});
    }

    TEST_CASE("006: concurrent spawns never inherit each other's pipes", "[006][process][concurrency]") {
        if (!fs::exists("/proc/self/fd")) {
            SKIP("no /proc/self/fd");
        }
        auto ls = internal::find_executable("ls", "/usr/bin:/bin");
        REQUIRE(ls.has_value());
        std::vector<std::string> args{ls->string(), "/proc/self/fd"};

        // whatever the child sees with no other spawns in flight
        auto baseline = internal::run_subprocess(args, 5'000);
        REQUIRE(baseline.exit_code == 0);

        constexpr int workers = 4;
        constexpr int rounds = 25;
        std::atomic<int> mismatches{0};
        std::atomic<int> failures{0};

        std::vector<std::thread> threads{};
        threads.reserve(workers);
        for (int i = 0; i < workers; ++i) {
            threads.emplace_back([&] {
                for (int r = 0; r < rounds; ++r) {
                    try {
                        auto result = internal::run_subprocess(args, 5'000);
                        if (result.exit_code != 0 || result.stdout_output != baseline.stdout_output) {
                            ++mismatches;
                        }
                    } catch (const std::exception&) {
                        ++failures;
                    }
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        CHECK(failures.load() == 0);
        CHECK(mismatches.load() == 0);
    }

    TEST_CASE("006: exec failures surface as spawn errors", "[006][process]") {
        detail::temp_dir temp{"systree_spawn"};

        CHECK_THROWS_AS(internal::run_subprocess({(temp.path / "absent").string()}, 1'000), internal::spawn_error);

        auto garbage = temp.path / "garbage";
        detail::make_executable_file(garbage, "\x7f\x01\x02 not a program"sv);
        CHECK_THROWS_AS(internal::run_subprocess({garbage.string()}, 1'000), internal::spawn_error);
    }

}  // namespace systree::test
