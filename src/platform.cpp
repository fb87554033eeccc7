#include "internal/platform.hpp"

#include <filesystem>
#include <system_error>

#if SYSTREE_PLATFORM_MACOS
#include <mach-o/dyld.h>

#include <climits>
#include <cstdint>
#endif

namespace fs = std::filesystem;

namespace systree::internal::platform {

    fs::path resolve_self_exe() {
        if constexpr (is_linux) {
            std::error_code ec{};
            auto path = fs::read_symlink("/proc/self/exe", ec);
            if (!ec) {
                return path;
            }
        }
#if SYSTREE_PLATFORM_MACOS
        if constexpr (is_macos) {
            char buf[PATH_MAX]{};
            uint32_t size = sizeof(buf);
            if (_NSGetExecutablePath(buf, &size) == 0) {
                std::error_code ec{};
                auto path = fs::canonical(buf, ec);
                if (!ec) {
                    return path;
                }
            }
        }
#endif
        return {};
    }

}  // namespace systree::internal::platform
