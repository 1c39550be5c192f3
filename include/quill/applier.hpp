#pragma once

#include "change.hpp"
#include "workspace.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill {

    struct apply_result {
        std::vector<std::string> written_paths{};
        // hand to revert_changes() to undo this batch
        std::vector<change_ref> revert_handle{};
    };

    // One applied change as recorded by the workspace ledger
    struct ledger_entry {
        change_ref ref{};
        std::string file_path{};
        std::string before{};
        bool before_existed{true};
        std::string after{};
        change_status status{change_status::applied};
        int64_t applied_at_ms{};
        std::optional<int64_t> reverted_at_ms{};
    };

    /*
     * Applies accepted changes to the workspace and undoes them later.
     *
     * apply_changes() is all-or-nothing: every change is validated (status, baseline
     * snapshot, path) before anything is written, new content is staged into sibling
     * temporaries, and the temporaries are renamed into place; a failing rename rolls the
     * already renamed files back. Applied changes are recorded in a ledger that is persisted
     * to `ledger_path` (when non-empty) so a later process can still revert them. A reverted
     * entry keeps only its metadata, and at most `max_reverted_entries` of them are kept
     * (oldest dropped first); applied entries are never dropped.
     */
    class change_applier {
      public:
        explicit change_applier(
                const workspace& ws, std::filesystem::path ledger_path = {}, size_t max_reverted_entries = 64U);

        /*
         * Throws apply_error:
         * - invalid_change_state: a change is not accepted/modified, or two changes target one path
         * - stale_change: the file no longer matches the change's `original` snapshot
         * - io_failure: staging or renaming failed; nothing is left modified
         * On success each change in `changes` is marked applied.
         */
        apply_result apply_changes(std::string_view execution_id, std::vector<change>& changes);

        /*
         * Restores the pre-apply bytes of every referenced change (deleting files the change
         * created). Throws apply_error{not_applied|already_reverted} before touching anything.
         * Returns the restored paths.
         */
        std::vector<std::string> revert_changes(const std::vector<change_ref>& refs);

        std::vector<ledger_entry> ledger() const;
        std::optional<ledger_entry> find(const change_ref& ref) const;

      private:
        const workspace& workspace_;
        std::filesystem::path ledger_path_;
        size_t max_reverted_entries_;
        mutable std::mutex mutex_;
        std::vector<ledger_entry> entries_{};

        void load_ledger();
        void compact_locked();
        void persist_ledger_locked() const;
        ledger_entry* find_locked(const change_ref& ref);
    };

}  // namespace quill
