#include "quill/engine.hpp"

#include "quill/config.hpp"
#include "quill/format.hpp"
#include "quill/utils.hpp"

#include "internal/extractor.hpp"

#include <algorithm>
#include <ranges>
#include <system_error>

using namespace quill::literals;

namespace quill {

    namespace fs = std::filesystem;

    struct execution_engine::execution {
        std::string id{};
        parsed_command command{};
        std::vector<std::string> selection{};
        std::chrono::system_clock::time_point started_at{};
        execution_status status{execution_status::queued};
        std::string stream_buffer{};
        std::vector<change> changes{};
        std::vector<std::string> context_files{};
        size_t knowledge_count{};
        std::vector<std::string> warnings{};
        bool truncated{false};
        std::optional<failure_info> failure{};
        std::optional<apply_result> applied{};
        // cancel() arrived while committing
        bool cancel_requested{false};
        bool subscribed{false};
        // run() has returned; the jthread joins without waiting
        bool worker_done{false};
        size_t next_change{1U};
        std::shared_ptr<event_channel> channel{};

        execution_snapshot snapshot() const {
            return execution_snapshot{
                    .id = id,
                    .status = status,
                    .started_at = started_at,
                    .command = command,
                    .context_files = context_files,
                    .knowledge_count = knowledge_count,
                    .stream_buffer = stream_buffer,
                    .changes = changes,
                    .warnings = warnings,
                    .truncated = truncated,
                    .failure = failure,
                    .applied = applied};
        }

        change* find_change(std::string_view change_id) {
            auto it = std::ranges::find(changes, change_id, &change::id);
            return it == changes.end() ? nullptr : &*it;
        }
    };

    struct execution_engine::proposal {
        bool is_diff{false};
        std::string path{};
        std::string content{};
        std::string description{};
        bool truncated{false};
    };

    namespace detail {

        static constexpr auto stream_poll_interval = std::chrono::milliseconds{50};

        constexpr bool is_settled(execution_status status) {
            return status != execution_status::queued && status != execution_status::running &&
                   status != execution_status::committing;
        }

        // Closes the backend stream when the worker leaves, whatever the reason
        struct stream_guard {
            std::unique_ptr<backend_stream> stream{};

            ~stream_guard() {
                if (!stream) {
                    return;
                }
                try {
                    stream->close();
                } catch (const std::exception& e) {
                    warn_log("backend teardown failed: ", e.what());
                }
            }
        };

        static std::string describe_decision(const decision_record& record) {
            return "{} {} ({}/{})"_format(
                    to_string(record.kind), record.file_path, record.execution_id, record.change_id);
        }

        static std::string context_summary(const execution_context& ctx) {
            std::string out = "dry run: {} file(s), {} knowledge snippet(s); no backend request sent\n"_format(
                    ctx.files.size(), ctx.knowledge_snippets.size());
            for (const auto& file : ctx.files) {
                out.append("  {} ({} bytes)\n"_format(file.path, file.content.size()));
            }
            for (const auto& snippet : ctx.knowledge_snippets) {
                out.append("  [{}] {:.2f}\n"_format(snippet.provenance, snippet.relevance));
            }
            return out;
        }

    }  // namespace detail

    engine_options engine_options::from_config(const startup_config& cfg) {
        engine_options opts{};
        opts.system_prompt = cfg.system_prompt;
        opts.connect_timeout = std::chrono::milliseconds{cfg.connect_timeout_ms};
        opts.event_buffer_capacity = cfg.event_buffer_capacity;
        opts.max_file_bytes = cfg.max_file_bytes;
        return opts;
    }

    execution_engine::execution_engine(
            const workspace& ws,
            context_builder& builder,
            reasoning_backend& backend,
            change_applier& applier,
            engine_options opts)
            : workspace_{ws}, builder_{builder}, backend_{backend}, applier_{applier}, opts_{std::move(opts)} {}

    execution_engine::~execution_engine() {
        // jthread requests stop and joins
        workers_.clear();
    }

    std::shared_ptr<execution_engine::execution> execution_engine::find_locked(std::string_view execution_id) const {
        auto it = std::ranges::find_if(executions_, [&](const auto& exec) { return exec->id == execution_id; });
        if (it == executions_.end()) {
            throw engine_error{engine_errc::unknown_execution, "unknown execution: {}"_format(execution_id)};
        }
        return *it;
    }

    std::string execution_engine::submit(std::string_view raw_input, const std::vector<std::string>& selection) {
        auto command = parse(raw_input);
        auto verdict = validate(command);
        if (!verdict.ok()) {
            throw parse_error{verdict.status, verdict.detail};
        }

        // joined after the lock is released
        std::vector<std::jthread> finished{};
        std::lock_guard lock{mutex_};
        for (const auto& other : executions_) {
            if (other->status == execution_status::queued || other->status == execution_status::running) {
                throw busy_error{other->id};
            }
        }
        reap_locked(finished);

        auto exec = std::make_shared<execution>();
        exec->started_at = std::chrono::system_clock::now();
        exec->id = "ex-{:x}-{}"_format(
                std::chrono::duration_cast<std::chrono::milliseconds>(exec->started_at.time_since_epoch()).count(),
                next_id_++);
        exec->command = std::move(command);
        exec->selection = selection;
        exec->channel = std::make_shared<event_channel>(opts_.event_buffer_capacity);
        executions_.push_back(exec);

        // dispatch: the channel is empty, so this never waits
        exec->status = execution_status::running;
        exec->channel->push(execution_event{
                .kind = event_kind::started, .execution_id = exec->id, .text = exec->command.raw_input});

        workers_.emplace(exec->id, std::jthread{[this, exec](std::stop_token stop) { run(exec, stop); }});
        debug_log("submitted ", exec->id, ": /", exec->command.verb);
        return exec->id;
    }

    void execution_engine::reap_locked(std::vector<std::jthread>& finished) {
        for (auto it = workers_.begin(); it != workers_.end();) {
            auto exec = std::ranges::find_if(executions_, [&](const auto& e) { return e->id == it->first; });
            if (exec == executions_.end() || (*exec)->worker_done) {
                finished.push_back(std::move(it->second));
                it = workers_.erase(it);
            }
            else {
                ++it;
            }
        }

        // oldest first; executions with pending decisions or a live worker stay
        for (auto it = executions_.begin();
             executions_.size() > opts_.max_retained_executions && it != executions_.end();) {
            if (is_terminal((*it)->status) && (*it)->worker_done) {
                debug_log("dropping finished execution ", (*it)->id);
                it = executions_.erase(it);
            }
            else {
                ++it;
            }
        }
    }

    void execution_engine::cancel(std::string_view execution_id) {
        std::shared_ptr<event_channel> channel{};
        {
            std::lock_guard lock{mutex_};
            auto exec = find_locked(execution_id);
            if (is_terminal(exec->status)) {
                return;
            }
            if (exec->status == execution_status::committing) {
                // the apply in flight is atomic; commit() settles the outcome
                exec->cancel_requested = true;
                return;
            }
            exec->status = execution_status::cancelled;
            if (auto worker = workers_.find(execution_id); worker != workers_.end()) {
                worker->second.request_stop();
            }
            channel = exec->channel;
            settled_.notify_all();
        }
        channel->close_with(execution_event{.kind = event_kind::cancelled, .execution_id = std::string{execution_id}});
        debug_log("cancelled ", execution_id);
    }

    void execution_engine::decide(std::string_view execution_id, std::string_view change_id, const decision& d) {
        std::lock_guard lock{mutex_};
        auto exec = find_locked(execution_id);
        if (exec->status != execution_status::awaiting_decision) {
            throw engine_error{
                    engine_errc::not_actionable,
                    "execution {} is {}; decisions are only taken while awaiting_decision"_format(
                            execution_id, to_string(exec->status))};
        }
        auto* target = exec->find_change(change_id);
        if (target == nullptr) {
            throw engine_error{
                    engine_errc::unknown_change, "execution {} has no change {}"_format(execution_id, change_id)};
        }

        auto next = change_status::accepted;
        switch (d.kind) {
            case decision_kind::accept:
                next = change_status::accepted;
                break;
            case decision_kind::reject:
                next = change_status::rejected;
                break;
            case decision_kind::edit:
                next = change_status::modified;
                break;
        }
        if (!can_transition(target->status, next)) {
            throw engine_error{
                    engine_errc::not_actionable,
                    "change {} cannot go from {} to {}"_format(change_id, to_string(target->status), to_string(next))};
        }
        if (d.kind == decision_kind::edit) {
            target->modified = d.new_content;
            auto anchor = compute_anchor(target->original, target->modified);
            target->start_line = anchor.start_line;
            target->end_line = anchor.end_line;
        }
        (void)target->try_transition(next);
        decisions_.push_back(decision_record{
                .execution_id = exec->id, .change_id = target->id, .file_path = target->file_path, .kind = d.kind});
    }

    apply_result execution_engine::commit(std::string_view execution_id) {
        std::shared_ptr<execution> exec{};
        std::vector<change> batch{};
        {
            std::lock_guard lock{mutex_};
            exec = find_locked(execution_id);
            if (exec->status != execution_status::awaiting_decision) {
                throw engine_error{
                        engine_errc::not_actionable,
                        "execution {} is {}; only awaiting_decision can be committed"_format(
                                execution_id, to_string(exec->status))};
            }
            exec->status = execution_status::committing;
            exec->cancel_requested = false;
            for (const auto& item : exec->changes) {
                if (item.status != change_status::rejected) {
                    batch.push_back(item);
                }
            }
        }

        apply_result result{};
        if (!batch.empty()) {
            try {
                result = applier_.apply_changes(exec->id, batch);
            } catch (const apply_error& e) {
                std::lock_guard lock{mutex_};
                exec->status =
                        exec->cancel_requested ? execution_status::cancelled : execution_status::awaiting_decision;
                settled_.notify_all();
                debug_log("commit of ", execution_id, " refused: ", e.what());
                throw;
            }
        }

        std::lock_guard lock{mutex_};
        for (const auto& applied : batch) {
            if (auto* target = exec->find_change(applied.id)) {
                target->status = applied.status;
            }
        }
        exec->applied = result;
        exec->status = execution_status::completed;
        settled_.notify_all();
        return result;
    }

    std::vector<std::string> execution_engine::revert(std::string_view execution_id) {
        std::vector<change_ref> refs{};
        {
            std::lock_guard lock{mutex_};
            auto exec = find_locked(execution_id);
            if (!exec->applied) {
                throw engine_error{
                        engine_errc::not_actionable, "execution {} has nothing applied"_format(execution_id)};
            }
            refs = exec->applied->revert_handle;
        }

        auto restored = applier_.revert_changes(refs);

        std::lock_guard lock{mutex_};
        auto exec = find_locked(execution_id);
        for (const auto& ref : refs) {
            if (auto* target = exec->find_change(ref.change_id)) {
                (void)target->try_transition(change_status::reverted);
            }
        }
        return restored;
    }

    event_subscription execution_engine::subscribe(std::string_view execution_id) {
        std::lock_guard lock{mutex_};
        auto exec = find_locked(execution_id);
        if (exec->subscribed) {
            throw engine_error{
                    engine_errc::already_subscribed, "execution {} already has a subscriber"_format(execution_id)};
        }
        exec->subscribed = true;
        return event_subscription{exec->channel};
    }

    execution_snapshot execution_engine::get(std::string_view execution_id) const {
        std::lock_guard lock{mutex_};
        return find_locked(execution_id)->snapshot();
    }

    std::vector<execution_snapshot> execution_engine::list() const {
        std::lock_guard lock{mutex_};
        return executions_ | std::views::transform([](const auto& exec) { return exec->snapshot(); }) |
               std::ranges::to<std::vector>();
    }

    std::optional<std::string> execution_engine::active_id() const {
        std::lock_guard lock{mutex_};
        for (const auto& exec : executions_) {
            if (exec->status == execution_status::queued || exec->status == execution_status::running) {
                return exec->id;
            }
        }
        return std::nullopt;
    }

    std::vector<decision_record> execution_engine::decisions() const {
        std::lock_guard lock{mutex_};
        return decisions_;
    }

    std::vector<execution_event> execution_engine::events(std::string_view execution_id) const {
        std::shared_ptr<event_channel> channel{};
        {
            std::lock_guard lock{mutex_};
            channel = find_locked(execution_id)->channel;
        }
        return channel->history();
    }

    bool execution_engine::wait_until_settled(std::string_view execution_id, std::chrono::milliseconds timeout) const {
        std::unique_lock lock{mutex_};
        auto exec = find_locked(execution_id);
        return settled_.wait_for(
                lock, timeout, [&exec] { return detail::is_settled(exec->status) && exec->worker_done; });
    }

    size_t execution_engine::worker_count() const {
        std::lock_guard lock{mutex_};
        return workers_.size();
    }

    // ── worker ──────────────────────────────────────────────────────

    bool execution_engine::emit(execution& exec, execution_event event, std::stop_token stop) {
        event.execution_id = exec.id;
        return exec.channel->push(std::move(event), stop);
    }

    void execution_engine::add_warning(execution& exec, std::string warning) {
        debug_log(exec.id, ": ", warning);
        std::lock_guard lock{mutex_};
        exec.warnings.push_back(std::move(warning));
    }

    void execution_engine::run(std::shared_ptr<execution> exec, std::stop_token stop) {
        run_stages(exec, stop);
        std::lock_guard lock{mutex_};
        exec->worker_done = true;
        settled_.notify_all();
    }

    void execution_engine::run_stages(const std::shared_ptr<execution>& exec, std::stop_token stop) {
        try {
            auto ctx = builder_.build(exec->command, exec->selection, decisions(), stop);
            if (stop.stop_requested()) {
                return;
            }
            {
                std::lock_guard lock{mutex_};
                for (const auto& file : ctx.files) {
                    exec->context_files.push_back(file.path);
                }
                exec->knowledge_count = ctx.knowledge_snippets.size();
                exec->warnings.insert(exec->warnings.end(), ctx.warnings.begin(), ctx.warnings.end());
            }
            for (const auto& file : ctx.files) {
                if (!emit(*exec, {.kind = event_kind::file_read, .text = file.path}, stop)) {
                    return;
                }
            }

            if (exec->command.has_flag("dry-run")) {
                emit(*exec, {.kind = event_kind::progress, .text = detail::context_summary(ctx)}, stop);
            }
            else if (exec->command.verb == "help"sv) {
                emit(*exec, {.kind = event_kind::progress, .text = command_reference()}, stop);
            }
            else {
                stream_response(*exec, ctx, stop);
            }
            if (stop.stop_requested()) {
                return;
            }
            finish(*exec, stop);
        } catch (const context_build_error& e) {
            fail(*exec, "context"sv, to_string(e.code()), e.what(), stop);
        } catch (const execution_error& e) {
            fail(*exec, "execution"sv, to_string(e.code()), e.what(), stop);
        } catch (const std::exception& e) {
            fail(*exec, "execution"sv, to_string(execution_errc::backend_protocol_error), e.what(), stop);
        }
    }

    void execution_engine::stream_response(execution& exec, const execution_context& ctx, std::stop_token stop) {
        backend_request request{};
        request.system_prompt = opts_.system_prompt;
        if (!request.system_prompt.empty()) {
            request.system_prompt.append("\n\n");
        }
        request.system_prompt.append(verb_preamble(exec.command.verb));
        request.user_request = exec.command.argument.empty() ? std::string{utils::trim_view(exec.command.raw_input)}
                                                             : exec.command.argument;
        request.verb = exec.command.verb;
        request.model = exec.command.flag_string("model");
        for (const auto& [name, value] : exec.command.flags) {
            if (const auto* text = std::get_if<std::string>(&value)) {
                request.flags.emplace(name, *text);
            }
            else {
                request.flags.emplace(name, std::get<bool>(value) ? "true" : "false");
            }
        }
        for (const auto& file : ctx.files) {
            request.files.push_back(backend_file{file.path, file.content});
        }
        request.knowledge = ctx.knowledge_snippets;
        for (const auto& record : ctx.prior_decisions) {
            request.prior_decisions.push_back(detail::describe_decision(record));
        }

        auto connect_deadline = std::chrono::steady_clock::now() + opts_.connect_timeout;
        detail::stream_guard guard{backend_.stream(request)};
        bool connected = false;
        internal::block_extractor extractor{};

        auto propose_blocks = [&](std::vector<internal::extracted_block> blocks) {
            for (auto& block : blocks) {
                propose(exec,
                        proposal{.is_diff = block.is_diff,
                                 .path = std::move(block.path),
                                 .content = std::move(block.content),
                                 .truncated = block.truncated},
                        stop);
            }
        };
        auto mark_truncated = [&](std::string warning) {
            add_warning(exec, std::move(warning));
            std::lock_guard lock{mutex_};
            exec.truncated = true;
        };

        for (;;) {
            if (stop.stop_requested()) {
                return;
            }
            auto chunk = guard.stream->next(detail::stream_poll_interval);
            if (!chunk) {
                if (!connected && std::chrono::steady_clock::now() >= connect_deadline) {
                    throw execution_error{
                            execution_errc::timeout,
                            "backend produced no output within {}ms"_format(opts_.connect_timeout.count())};
                }
                continue;
            }
            connected = true;

            switch (chunk->kind) {
                case chunk_kind::text: {
                    {
                        std::lock_guard lock{mutex_};
                        if (exec.status != execution_status::running) {
                            return;
                        }
                        exec.stream_buffer.append(chunk->payload);
                    }
                    if (!emit(exec, {.kind = event_kind::progress, .text = chunk->payload}, stop)) {
                        return;
                    }
                    propose_blocks(extractor.feed(chunk->payload));
                    break;
                }
                case chunk_kind::thinking:
                    if (!emit(exec, {.kind = event_kind::thinking, .text = std::move(chunk->payload)}, stop)) {
                        return;
                    }
                    break;
                case chunk_kind::code_block:
                case chunk_kind::diff_block:
                    propose(exec,
                            proposal{.is_diff = chunk->kind == chunk_kind::diff_block,
                                     .path = std::move(chunk->path),
                                     .content = std::move(chunk->payload),
                                     .description = std::move(chunk->description)},
                            stop);
                    break;
                case chunk_kind::disconnected:
                    mark_truncated("backend closed the stream without an end marker");
                    [[fallthrough]];
                case chunk_kind::end:
                    if (auto open = extractor.finish()) {
                        if (open->truncated) {
                            mark_truncated("stream ended inside the block for {}"_format(open->path));
                        }
                        propose_blocks({std::move(*open)});
                    }
                    return;
            }
        }
    }

    void execution_engine::propose(execution& exec, proposal block, std::stop_token stop) {
        auto rel = workspace_.normalize(block.path);
        if (!rel || rel->empty()) {
            add_warning(exec, "ignored change outside the workspace: {}"_format(block.path));
            return;
        }

        std::optional<std::string> existing_id{};
        std::string original{};
        bool original_exists = true;
        std::string base{};
        {
            std::lock_guard lock{mutex_};
            if (exec.status != execution_status::running) {
                return;
            }
            auto it = std::ranges::find(exec.changes, *rel, &change::file_path);
            if (it != exec.changes.end()) {
                existing_id = it->id;
                original = it->original;
                original_exists = it->original_exists;
                base = it->modified;
            }
        }

        if (!existing_id) {
            auto absolute = workspace_.root() / *rel;
            std::error_code ec{};
            original_exists = fs::exists(absolute, ec);
            if (original_exists) {
                auto size = fs::file_size(absolute, ec);
                if (!ec && size > opts_.max_file_bytes) {
                    add_warning(exec, "{} is larger than {} bytes; change ignored"_format(*rel, opts_.max_file_bytes));
                    return;
                }
                try {
                    original = read_file_bytes(absolute);
                } catch (const std::system_error& e) {
                    add_warning(exec, "cannot read {}: {}; change ignored"_format(*rel, e.code().message()));
                    return;
                }
            }
            base = original;
        }

        std::string modified{};
        if (block.is_diff) {
            auto patched = block.truncated ? apply_truncated_unified_diff(base, block.content)
                                           : apply_unified_diff(base, block.content);
            if (!patched) {
                add_warning(exec, "diff for {} does not apply; change ignored"_format(*rel));
                return;
            }
            modified = std::move(*patched);
        }
        else {
            modified = std::move(block.content);
        }
        if (original_exists && modified == original && !existing_id) {
            debug_log(exec.id, ": block for ", *rel, " leaves the file unchanged");
            return;
        }

        auto anchor = compute_anchor(original, modified);
        if (block.description.empty()) {
            block.description = original_exists ? "update {}"_format(*rel) : "create {}"_format(*rel);
        }
        if (block.truncated) {
            block.description.append(" (truncated)");
        }

        change proposed{};
        {
            std::lock_guard lock{mutex_};
            if (exec.status != execution_status::running) {
                return;
            }
            change* target = existing_id ? exec.find_change(*existing_id) : nullptr;
            if (target == nullptr) {
                exec.changes.push_back(change{
                        .id = "c{}"_format(exec.next_change++),
                        .file_path = *rel,
                        .original = std::move(original),
                        .original_exists = original_exists,
                        .status = change_status::pending});
                target = &exec.changes.back();
            }
            target->modified = std::move(modified);
            target->start_line = anchor.start_line;
            target->end_line = anchor.end_line;
            target->description = std::move(block.description);
            proposed = *target;
        }
        auto path = proposed.file_path;
        emit(exec, {.kind = event_kind::code_change_proposed, .text = std::move(path), .proposed = std::move(proposed)},
             stop);
    }

    void execution_engine::finish(execution& exec, std::stop_token stop) {
        execution_event event{.kind = event_kind::completed};
        {
            std::lock_guard lock{mutex_};
            if (exec.status != execution_status::running) {
                return;
            }
            exec.status = exec.changes.empty() ? execution_status::completed : execution_status::awaiting_decision;
            event.truncated = exec.truncated;
            event.change_count = exec.changes.size();
            settled_.notify_all();
        }
        emit(exec, std::move(event), stop);
    }

    void execution_engine::fail(
            execution& exec,
            std::string_view category,
            std::string_view kind,
            std::string message,
            std::stop_token stop) {
        execution_event event{.kind = event_kind::error, .text = message, .error_kind = "{}.{}"_format(category, kind)};
        {
            std::lock_guard lock{mutex_};
            if (exec.status != execution_status::running) {
                return;
            }
            exec.status = execution_status::failed;
            exec.failure = failure_info{std::string{category}, std::string{kind}, std::move(message)};
            settled_.notify_all();
        }
        debug_log(exec.id, " failed: ", event.error_kind);
        emit(exec, std::move(event), stop);
    }

}  // namespace quill
