#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

    enum class change_status : uint8_t {
        pending,
        accepted,
        rejected,
        modified,
        applied,
        reverted,
    };

    inline constexpr std::string_view to_string(change_status status) {
        switch (status) {
            case change_status::pending:
                return "pending"sv;
            case change_status::accepted:
                return "accepted"sv;
            case change_status::rejected:
                return "rejected"sv;
            case change_status::modified:
                return "modified"sv;
            case change_status::applied:
                return "applied"sv;
            case change_status::reverted:
                return "reverted"sv;
        }
        return "pending"sv;
    }

    bool try_parse_change_status(std::string_view text, change_status& out);

    /*
     * Allowed edges:
     *   pending|accepted|rejected|modified -> accepted|rejected|modified   (user decisions)
     *   accepted|modified                  -> applied
     *   applied                            -> reverted
     * applied and reverted never go back to a decision state.
     */
    constexpr bool can_transition(change_status from, change_status to) {
        switch (to) {
            case change_status::accepted:
            case change_status::rejected:
            case change_status::modified:
                return from == change_status::pending || from == change_status::accepted ||
                       from == change_status::rejected || from == change_status::modified;
            case change_status::applied:
                return from == change_status::accepted || from == change_status::modified;
            case change_status::reverted:
                return from == change_status::applied;
            case change_status::pending:
                return false;
        }
        return false;
    }

    struct change {
        std::string id{};
        std::string file_path{};
        std::string original{};
        // false when the change creates `file_path`
        bool original_exists{true};
        std::string modified{};
        // 1-based, inclusive range of `original` the change touches; 0/0 when unknown
        size_t start_line{};
        size_t end_line{};
        std::string description{};
        change_status status{change_status::pending};

        bool is_applicable() const noexcept {
            return status == change_status::accepted || status == change_status::modified;
        }

        bool try_transition(change_status next) noexcept {
            if (!can_transition(status, next)) {
                return false;
            }
            status = next;
            return true;
        }
    };

    // Identifies a change across executions (change ids are only unique per execution)
    struct change_ref {
        std::string execution_id{};
        std::string change_id{};

        bool operator==(const change_ref&) const = default;
    };

    enum class diff_line_kind : uint8_t { context, addition, deletion };

    struct diff_line {
        diff_line_kind kind{diff_line_kind::context};
        std::string text{};
        std::optional<size_t> old_line{};
        std::optional<size_t> new_line{};
    };

    struct diff_hunk {
        size_t old_start{};
        size_t old_count{};
        size_t new_start{};
        size_t new_count{};
        std::vector<diff_line> lines{};
    };

    // Line oriented diff; identical inputs yield no hunks
    std::vector<diff_hunk> generate_diff(std::string_view original, std::string_view modified, size_t context = 3U);

    // Renders hunks as a unified diff with `a/` and `b/` headers
    std::string format_unified_diff(std::string_view path, const std::vector<diff_hunk>& hunks);

    // Applies a unified diff to `original`; nullopt when a hunk does not match
    std::optional<std::string> apply_unified_diff(std::string_view original, std::string_view diff);

    /*
     * For a diff whose stream was cut off: an unfinished last hunk applies the lines it already
     * has. A last line that does not match is taken as cut short, and an unfinished hunk that
     * does not match is dropped. nullopt when nothing usable remains.
     */
    std::optional<std::string> apply_truncated_unified_diff(std::string_view original, std::string_view diff);

    // Target path named by the `+++` header of a unified diff, without its `b/` prefix
    std::optional<std::string> unified_diff_target(std::string_view diff);

    struct line_anchor {
        size_t start_line{};
        size_t end_line{};
    };

    // First and last line of `original` touched by the edit; an insertion anchors to the line it follows
    line_anchor compute_anchor(std::string_view original, std::string_view modified);

}  // namespace quill
