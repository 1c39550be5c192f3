#include "quill/applier.hpp"

#include "quill/format.hpp"
#include "quill/utils.hpp"

#include "internal/json.hpp"
#include "internal/types.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

using namespace quill::literals;

namespace quill {

    namespace fs = std::filesystem;

    namespace detail {

        static int64_t now_ms() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                    .count();
        }

        struct staged_write {
            fs::path target{};
            // empty when the target is to be removed
            fs::path temp{};
        };

        static void discard_temps(const std::vector<staged_write>& staged) {
            for (const auto& write : staged) {
                if (write.temp.empty()) {
                    continue;
                }
                std::error_code ec{};
                fs::remove(write.temp, ec);
            }
        }

        // Puts `bytes` back at `target` (or removes it when `existed` is false); failures are only logged
        static void restore_best_effort(const fs::path& target, const std::string& bytes, bool existed) {
            try {
                if (existed) {
                    write_file_atomic(target, bytes);
                }
                else {
                    fs::remove(target);
                }
            } catch (const std::exception& e) {
                warn_log("rollback of ", target.string(), " failed: ", e.what());
            }
        }

        static internal::ledger_record to_record(const ledger_entry& entry) {
            return internal::ledger_record{
                    .execution_id = entry.ref.execution_id,
                    .change_id = entry.ref.change_id,
                    .file_path = entry.file_path,
                    .before = entry.before,
                    .before_existed = entry.before_existed,
                    .after = entry.after,
                    .status = std::string{to_string(entry.status)},
                    .applied_at_ms = entry.applied_at_ms,
                    .reverted_at_ms = entry.reverted_at_ms};
        }

        static ledger_entry from_record(const internal::ledger_record& record, const fs::path& path) {
            ledger_entry entry{};
            entry.ref = change_ref{record.execution_id, record.change_id};
            entry.file_path = record.file_path;
            entry.before = record.before;
            entry.before_existed = record.before_existed;
            entry.after = record.after;
            if (!try_parse_change_status(record.status, entry.status) ||
                (entry.status != change_status::applied && entry.status != change_status::reverted)) {
                throw std::runtime_error("invalid ledger status in {}: {}"_format(path.string(), record.status));
            }
            entry.applied_at_ms = record.applied_at_ms;
            entry.reverted_at_ms = record.reverted_at_ms;
            return entry;
        }

    }  // namespace detail

    change_applier::change_applier(const workspace& ws, fs::path ledger_path, size_t max_reverted_entries)
            : workspace_{ws}, ledger_path_{std::move(ledger_path)}, max_reverted_entries_{max_reverted_entries} {
        load_ledger();
    }

    void change_applier::load_ledger() {
        if (ledger_path_.empty()) {
            return;
        }
        std::error_code ec{};
        if (!fs::exists(ledger_path_, ec)) {
            return;
        }
        auto data = internal::read_json_file<internal::persisted_ledger>(ledger_path_, true);
        internal::validate_supported_schema_version(data.schema_version, ledger_path_);
        for (const auto& record : data.entries) {
            entries_.push_back(detail::from_record(record, ledger_path_));
        }
        debug_log("loaded ", entries_.size(), " ledger entries from ", ledger_path_.string());
        compact_locked();
    }

    void change_applier::compact_locked() {
        size_t reverted = 0U;
        for (auto& entry : entries_) {
            if (entry.status == change_status::reverted) {
                // nothing can be restored from a reverted entry
                std::string{}.swap(entry.before);
                std::string{}.swap(entry.after);
                ++reverted;
            }
        }
        for (auto it = entries_.begin(); reverted > max_reverted_entries_ && it != entries_.end();) {
            if (it->status == change_status::reverted) {
                it = entries_.erase(it);
                --reverted;
            }
            else {
                ++it;
            }
        }
    }

    void change_applier::persist_ledger_locked() const {
        if (ledger_path_.empty()) {
            return;
        }
        internal::persisted_ledger data{};
        data.entries.reserve(entries_.size());
        for (const auto& entry : entries_) {
            data.entries.push_back(detail::to_record(entry));
        }
        try {
            internal::write_json_file(data, ledger_path_);
        } catch (const std::exception& e) {
            warn_log("change ledger not persisted: ", e.what());
        }
    }

    ledger_entry* change_applier::find_locked(const change_ref& ref) {
        // newest first: a ref is unique, but be explicit about which record wins
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (it->ref == ref) {
                return &*it;
            }
        }
        return nullptr;
    }

    apply_result change_applier::apply_changes(std::string_view execution_id, std::vector<change>& changes) {
        std::lock_guard lock{mutex_};

        struct planned {
            change* source{};
            std::string rel{};
            fs::path absolute{};
        };

        std::vector<planned> plan{};
        plan.reserve(changes.size());
        for (auto& item : changes) {
            if (!item.is_applicable()) {
                throw apply_error{
                        apply_errc::invalid_change_state,
                        "change {} is {}, expected accepted or modified"_format(item.id, to_string(item.status)),
                        item.id};
            }
            auto rel = workspace_.normalize(item.file_path);
            if (!rel || rel->empty()) {
                throw apply_error{
                        apply_errc::invalid_change_state,
                        "change {} targets a path outside the workspace: {}"_format(item.id, item.file_path),
                        item.id};
            }
            auto duplicate = std::ranges::find(plan, *rel, &planned::rel);
            if (duplicate != plan.end()) {
                throw apply_error{
                        apply_errc::invalid_change_state,
                        "changes {} and {} both target {}"_format(duplicate->source->id, item.id, *rel),
                        item.id};
            }
            plan.push_back({&item, *rel, workspace_.root() / *rel});
        }

        for (const auto& step : plan) {
            std::error_code ec{};
            auto exists = fs::exists(step.absolute, ec);
            if (ec) {
                throw apply_error{
                        apply_errc::io_failure, "cannot stat {}: {}"_format(step.rel, ec.message()), step.source->id};
            }
            if (!step.source->original_exists) {
                if (exists) {
                    throw apply_error{
                            apply_errc::stale_change,
                            "change {} creates {} but the file now exists"_format(step.source->id, step.rel),
                            step.source->id};
                }
                continue;
            }
            if (!exists) {
                throw apply_error{
                        apply_errc::stale_change,
                        "change {}: {} was removed since it was proposed"_format(step.source->id, step.rel),
                        step.source->id};
            }
            std::string current{};
            try {
                current = read_file_bytes(step.absolute);
            } catch (const std::system_error& e) {
                throw apply_error{
                        apply_errc::io_failure,
                        "cannot read {}: {}"_format(step.rel, e.code().message()),
                        step.source->id};
            }
            if (current != step.source->original) {
                throw apply_error{
                        apply_errc::stale_change,
                        "change {}: {} was modified since it was proposed"_format(step.source->id, step.rel),
                        step.source->id};
            }
        }

        std::vector<detail::staged_write> staged{};
        staged.reserve(plan.size());
        for (const auto& step : plan) {
            try {
                staged.push_back({step.absolute, write_sibling_temp(step.absolute, step.source->modified)});
            } catch (const std::exception& e) {
                detail::discard_temps(staged);
                throw apply_error{
                        apply_errc::io_failure,
                        "cannot stage {}: {}"_format(step.rel, e.what()),
                        step.source->id};
            }
        }

        for (size_t i = 0U; i < staged.size(); ++i) {
            std::error_code ec{};
            fs::rename(staged[i].temp, staged[i].target, ec);
            if (!ec) {
                continue;
            }
            for (size_t k = 0U; k < i; ++k) {
                const auto* source = plan[k].source;
                detail::restore_best_effort(staged[k].target, source->original, source->original_exists);
            }
            detail::discard_temps(std::vector<detail::staged_write>(staged.begin() + static_cast<std::ptrdiff_t>(i),
                                                                    staged.end()));
            throw apply_error{
                    apply_errc::io_failure,
                    "cannot replace {}: {}"_format(plan[i].rel, ec.message()),
                    plan[i].source->id};
        }

        apply_result result{};
        auto applied_at = detail::now_ms();
        for (const auto& step : plan) {
            (void)step.source->try_transition(change_status::applied);
            change_ref ref{std::string{execution_id}, step.source->id};
            entries_.push_back(ledger_entry{
                    .ref = ref,
                    .file_path = step.rel,
                    .before = step.source->original,
                    .before_existed = step.source->original_exists,
                    .after = step.source->modified,
                    .status = change_status::applied,
                    .applied_at_ms = applied_at,
                    .reverted_at_ms = std::nullopt});
            result.written_paths.push_back(step.rel);
            result.revert_handle.push_back(std::move(ref));
        }
        persist_ledger_locked();

        debug_log("applied ", plan.size(), " change(s) for ", execution_id);
        return result;
    }

    std::vector<std::string> change_applier::revert_changes(const std::vector<change_ref>& refs) {
        std::lock_guard lock{mutex_};

        std::vector<ledger_entry*> targets{};
        for (const auto& ref : refs) {
            auto* entry = find_locked(ref);
            if (entry == nullptr) {
                throw apply_error{
                        apply_errc::not_applied,
                        "change {} of {} was never applied"_format(ref.change_id, ref.execution_id),
                        ref.change_id};
            }
            if (entry->status == change_status::reverted) {
                throw apply_error{
                        apply_errc::already_reverted,
                        "change {} of {} is already reverted"_format(ref.change_id, ref.execution_id),
                        ref.change_id};
            }
            if (std::ranges::find(targets, entry) == targets.end()) {
                targets.push_back(entry);
            }
        }

        std::vector<detail::staged_write> staged{};
        staged.reserve(targets.size());
        for (auto* entry : targets) {
            auto absolute = workspace_.root() / entry->file_path;
            if (!entry->before_existed) {
                staged.push_back({absolute, {}});
                continue;
            }
            try {
                staged.push_back({absolute, write_sibling_temp(absolute, entry->before)});
            } catch (const std::exception& e) {
                detail::discard_temps(staged);
                throw apply_error{
                        apply_errc::io_failure,
                        "cannot stage {}: {}"_format(entry->file_path, e.what()),
                        entry->ref.change_id};
            }
        }

        for (size_t i = 0U; i < staged.size(); ++i) {
            std::error_code ec{};
            if (staged[i].temp.empty()) {
                fs::remove(staged[i].target, ec);
            }
            else {
                fs::rename(staged[i].temp, staged[i].target, ec);
            }
            if (!ec) {
                continue;
            }
            for (size_t k = 0U; k < i; ++k) {
                detail::restore_best_effort(staged[k].target, targets[k]->after, true);
            }
            detail::discard_temps(std::vector<detail::staged_write>(staged.begin() + static_cast<std::ptrdiff_t>(i),
                                                                    staged.end()));
            throw apply_error{
                    apply_errc::io_failure,
                    "cannot restore {}: {}"_format(targets[i]->file_path, ec.message()),
                    targets[i]->ref.change_id};
        }

        std::vector<std::string> restored{};
        auto reverted_at = detail::now_ms();
        for (auto* entry : targets) {
            entry->status = change_status::reverted;
            entry->reverted_at_ms = reverted_at;
            restored.push_back(entry->file_path);
        }
        compact_locked();
        persist_ledger_locked();
        return restored;
    }

    std::vector<ledger_entry> change_applier::ledger() const {
        std::lock_guard lock{mutex_};
        return entries_;
    }

    std::optional<ledger_entry> change_applier::find(const change_ref& ref) const {
        std::lock_guard lock{mutex_};
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (it->ref == ref) {
                return *it;
            }
        }
        return std::nullopt;
    }

}  // namespace quill
