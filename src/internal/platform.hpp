#pragma once

#include <filesystem>
#include <string_view>

namespace systree::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = SYSTREE_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = SYSTREE_PLATFORM_MACOS != 0;

    inline constexpr char path_list_separator = ':';

    namespace tool {
        inline constexpr auto curl = "curl"sv;
    }  // namespace tool

    namespace env {
        inline constexpr auto path = "PATH"sv;
        inline constexpr auto home = "HOME"sv;
        inline constexpr auto xdg_cache_home = "XDG_CACHE_HOME"sv;
    }  // namespace env

    // Absolute path of the running executable, if the platform exposes it
    std::filesystem::path resolve_self_exe();

}  // namespace systree::internal::platform
