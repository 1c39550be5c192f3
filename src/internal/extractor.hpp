#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill::internal {

    struct extracted_block {
        bool is_diff{false};
        std::string path{};
        std::string language{};
        std::string content{};
        // the stream ended before the closing fence
        bool truncated{false};
    };

    /*
     * Incremental scanner for fenced blocks in streamed text.
     *
     * Text may arrive in arbitrary pieces; only complete lines are interpreted. An opening
     * fence names its target file in its info string, in one of these forms:
     *
     *   ```cpp src/main.cpp
     *   ```cpp:src/main.cpp
     *   ```cpp path=src/main.cpp
     *   ```src/main.cpp
     *
     * A `diff`/`patch` block may instead name its file in the `+++` header. Blocks without a
     * target are skipped.
     */
    class block_extractor {
      public:
        // Blocks completed by `text`, in stream order
        std::vector<extracted_block> feed(std::string_view text);

        // Flushes a trailing partial line; returns the block left open, if any
        std::optional<extracted_block> finish();

        bool in_block() const { return in_block_; }

      private:
        std::string partial_{};
        bool in_block_{false};
        size_t fence_len_{};
        char fence_char_{'`'};
        extracted_block current_{};

        std::optional<extracted_block> consume_line(std::string_view line);
        std::optional<extracted_block> close_block(bool truncated);
    };

}  // namespace quill::internal
