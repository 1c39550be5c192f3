#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

    struct file_node {
        std::string name{};
        // relative to the workspace root, generic separators
        std::string path{};
        bool is_directory{false};
        std::vector<file_node> children{};
    };

    struct file_info {
        std::string path{};
        bool is_directory{false};
        std::uintmax_t size{};
        size_t line_count{};
        std::string language{};
        std::filesystem::file_time_type modified_at{};
    };

    struct content_match {
        std::string path{};
        size_t line{};
        // 1-based, end exclusive
        size_t column_start{};
        size_t column_end{};
        std::string line_text{};
    };

    // Language id for syntax-aware consumers, derived from the file extension
    std::string_view detect_language(const std::filesystem::path& path);

    // Whole-file read; throws std::system_error carrying the errno of the failure
    std::string read_file_bytes(const std::filesystem::path& path);

    // Writes `bytes` to a fresh temporary next to `path` (parents created) and returns it
    std::filesystem::path write_sibling_temp(const std::filesystem::path& path, std::string_view bytes);

    // Writes to a sibling temporary and renames it over `path`; throws std::system_error
    void write_file_atomic(const std::filesystem::path& path, std::string_view bytes);

    class workspace {
      public:
        static constexpr size_t max_content_matches = 100U;

        explicit workspace(std::filesystem::path root);

        const std::filesystem::path& root() const noexcept { return root_; }

        // Absolute path for `relative`, or nullopt when it is absolute or escapes the root
        std::optional<std::filesystem::path> resolve(std::string_view relative) const;

        // Normalized relative spelling of `relative` (generic separators), or nullopt as for resolve()
        std::optional<std::string> normalize(std::string_view relative) const;

        file_node file_tree(std::string_view directory = {}, size_t max_depth = 16U) const;
        std::vector<std::string> search_files(std::string_view query, size_t limit = 50U) const;
        std::vector<content_match> search_content(std::string_view query, size_t limit = max_content_matches) const;

        // Throws context_build_error{not_found} for a missing path
        file_info get_file_info(std::string_view path) const;

        // Entries every walk skips: dot-files and build/vendor directories
        static bool is_ignored(std::string_view name);

      private:
        std::filesystem::path root_;

        // Regular files under the root in sorted relative-path order
        std::vector<std::string> list_files() const;
    };

}  // namespace quill
