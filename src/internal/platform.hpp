#pragma once

#include <string_view>

namespace quill::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = QUILL_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = QUILL_PLATFORM_MACOS != 0;

    inline constexpr auto version = std::string_view{QUILL_VERSION};

    // terminal type announced to sandbox shells; no cursor addressing or colors are interpreted
    inline constexpr auto sandbox_term = "dumb"sv;

    namespace tool {
        inline constexpr auto git = "git"sv;
        inline constexpr auto default_editor = "vi"sv;
    }  // namespace tool

}  // namespace quill::internal::platform
