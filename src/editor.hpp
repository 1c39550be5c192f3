#pragma once

#include "quill/config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace quill::cli {

    class line_editor {
      public:
        explicit line_editor(const startup_config& cfg);

        std::optional<std::string> read_line(std::string_view prompt);
    };

    /*
     * Opens `content` in $VISUAL / $EDITOR (falling back to vi) on a scratch file under
     * `scratch_dir` and returns the saved text. nullopt when the editor exits non-zero.
     */
    std::optional<std::string> edit_in_external_editor(
            const std::filesystem::path& scratch_dir, std::string_view file_name, std::string_view content);

}  // namespace quill::cli
