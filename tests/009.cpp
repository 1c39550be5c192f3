#include "utils.hpp"

namespace quill::test {

    namespace detail {
        static const execution_event& last_event(const std::vector<execution_event>& events) {
            REQUIRE_FALSE(events.empty());
            return events.back();
        }

        static bool has_warning(const execution_snapshot& snapshot, std::string_view text) {
            return std::ranges::find(snapshot.warnings, text) != snapshot.warnings.end();
        }
    }  // namespace detail

    TEST_CASE("009: proposed changes are committed after acceptance", "[009][engine]") {
        detail::engine_harness h{"quill_engine_commit"};
        detail::write_file(h.path("a.txt"), "alpha\n");
        h.backend.set_script(
                {detail::text_chunk("Working on it\n"),
                 detail::thinking_chunk("uppercase is enough"),
                 detail::code_chunk("a.txt", "ALPHA\n"),
                 detail::code_chunk("new.txt", "fresh\n", "add a new file"),
                 detail::end_chunk()});

        auto id = h.engine.submit("/implement uppercase @a.txt");
        auto events = detail::drain(h.engine, id);

        CHECK(detail::kinds_of(events) == std::vector<event_kind>{
                                                  event_kind::started,
                                                  event_kind::file_read,
                                                  event_kind::progress,
                                                  event_kind::thinking,
                                                  event_kind::code_change_proposed,
                                                  event_kind::code_change_proposed,
                                                  event_kind::completed});
        for (size_t i = 0U; i < events.size(); ++i) {
            CHECK(events[i].sequence == i);
            CHECK(events[i].execution_id == id);
        }
        CHECK(events[1].text == "a.txt");
        CHECK(events[2].text == "Working on it\n");
        REQUIRE(events[4].proposed);
        CHECK(events[4].proposed->id == "c1");
        CHECK(events[4].proposed->description == "update a.txt");
        REQUIRE(events[5].proposed);
        CHECK(events[5].proposed->id == "c2");
        CHECK(events[5].proposed->description == "add a new file");
        CHECK_FALSE(events[5].proposed->original_exists);
        CHECK(events[6].change_count == 2U);
        CHECK_FALSE(events[6].truncated);

        auto snapshot = h.engine.get(id);
        CHECK(snapshot.status == execution_status::awaiting_decision);
        CHECK(snapshot.stream_buffer == "Working on it\n");
        CHECK(snapshot.context_files == std::vector<std::string>{"a.txt"});
        CHECK_FALSE(h.engine.active_id());

        h.engine.decide(id, "c1", decision::accept());
        h.engine.decide(id, "c2", decision::accept());
        auto result = h.engine.commit(id);

        CHECK(result.written_paths == std::vector<std::string>{"a.txt", "new.txt"});
        CHECK(detail::read_file(h.path("a.txt")) == "ALPHA\n");
        CHECK(detail::read_file(h.path("new.txt")) == "fresh\n");
        snapshot = h.engine.get(id);
        CHECK(snapshot.status == execution_status::completed);
        REQUIRE(snapshot.applied);
        CHECK(snapshot.changes[0].status == change_status::applied);
        CHECK(h.engine.decisions().size() == 2U);

        auto restored = h.engine.revert(id);
        CHECK(restored == std::vector<std::string>{"a.txt", "new.txt"});
        CHECK(detail::read_file(h.path("a.txt")) == "alpha\n");
        CHECK_FALSE(std::filesystem::exists(h.path("new.txt")));
        CHECK(h.engine.get(id).changes[1].status == change_status::reverted);
    }

    TEST_CASE("009: rejected changes are skipped and edits replace the proposal", "[009][engine]") {
        detail::engine_harness h{"quill_engine_decide"};
        detail::write_file(h.path("a.txt"), "a\n");
        detail::write_file(h.path("b.txt"), "b\n");
        h.backend.set_script(
                {detail::code_chunk("a.txt", "A\n"), detail::code_chunk("b.txt", "B\n"), detail::end_chunk()});

        auto id = h.engine.submit("/implement shout");
        (void)detail::drain(h.engine, id);

        try {
            h.engine.decide(id, "c9", decision::accept());
            FAIL("expected unknown_change");
        } catch (const engine_error& e) {
            CHECK(e.code() == engine_errc::unknown_change);
        }

        h.engine.decide(id, "c1", decision::reject());
        h.engine.decide(id, "c2", decision::edit("line zero\nb edited\n"));
        auto snapshot = h.engine.get(id);
        CHECK(snapshot.changes[1].status == change_status::modified);
        CHECK(snapshot.changes[1].start_line == 1U);
        CHECK(snapshot.changes[1].end_line == 1U);

        auto result = h.engine.commit(id);
        CHECK(result.written_paths == std::vector<std::string>{"b.txt"});
        CHECK(detail::read_file(h.path("a.txt")) == "a\n");
        CHECK(detail::read_file(h.path("b.txt")) == "line zero\nb edited\n");

        snapshot = h.engine.get(id);
        CHECK(snapshot.changes[0].status == change_status::rejected);
        CHECK(snapshot.changes[1].status == change_status::applied);

        try {
            h.engine.decide(id, "c1", decision::accept());
            FAIL("expected not_actionable");
        } catch (const engine_error& e) {
            CHECK(e.code() == engine_errc::not_actionable);
        }
        try {
            h.engine.decide("ex-unknown", "c1", decision::accept());
            FAIL("expected unknown_execution");
        } catch (const engine_error& e) {
            CHECK(e.code() == engine_errc::unknown_execution);
        }
    }

    TEST_CASE("009: undecided changes refuse the commit and keep the execution open", "[009][engine]") {
        detail::engine_harness h{"quill_engine_undecided"};
        detail::write_file(h.path("a.txt"), "a\n");
        h.backend.set_script({detail::code_chunk("a.txt", "A\n"), detail::end_chunk()});

        auto id = h.engine.submit("/implement shout");
        (void)detail::drain(h.engine, id);

        try {
            (void)h.engine.commit(id);
            FAIL("expected invalid_change_state");
        } catch (const apply_error& e) {
            CHECK(e.code() == apply_errc::invalid_change_state);
        }
        CHECK(h.engine.get(id).status == execution_status::awaiting_decision);
        CHECK(detail::read_file(h.path("a.txt")) == "a\n");

        h.engine.decide(id, "c1", decision::accept());
        detail::write_file(h.path("a.txt"), "edited elsewhere\n");
        try {
            (void)h.engine.commit(id);
            FAIL("expected stale_change");
        } catch (const apply_error& e) {
            CHECK(e.code() == apply_errc::stale_change);
        }
        CHECK(h.engine.get(id).status == execution_status::awaiting_decision);

        h.engine.cancel(id);
        CHECK(h.engine.get(id).status == execution_status::cancelled);
        CHECK(detail::read_file(h.path("a.txt")) == "edited elsewhere\n");

        try {
            (void)h.engine.revert(id);
            FAIL("expected not_actionable");
        } catch (const engine_error& e) {
            CHECK(e.code() == engine_errc::not_actionable);
        }
    }

    TEST_CASE("009: one execution at a time and cancel is idempotent", "[009][engine]") {
        detail::engine_harness h{"quill_engine_busy"};
        h.backend.set_script({detail::text_chunk("thinking about it\n"), detail::end_chunk()}, 1U);

        auto first = h.engine.submit("/ask what is slow");
        REQUIRE(h.engine.active_id() == std::optional<std::string>{first});
        try {
            (void)h.engine.submit("/ask another thing");
            FAIL("expected busy_error");
        } catch (const busy_error& e) {
            CHECK(e.execution_id() == first);
        }

        h.engine.cancel(first);
        h.engine.cancel(first);
        auto events = detail::drain(h.engine, first);
        CHECK(detail::last_event(events).kind == event_kind::cancelled);
        CHECK(std::ranges::count(detail::kinds_of(events), event_kind::cancelled) == 1);
        CHECK(h.engine.get(first).status == execution_status::cancelled);
        CHECK_FALSE(h.engine.active_id());

        h.backend.set_script({detail::text_chunk("fast answer"), detail::end_chunk()});
        auto second = h.engine.submit("/ask again");
        CHECK(second != first);
        auto second_events = detail::drain(h.engine, second);
        CHECK(detail::last_event(second_events).kind == event_kind::completed);
        CHECK(h.engine.get(second).status == execution_status::completed);
        CHECK(h.engine.list().size() == 2U);

        try {
            (void)h.engine.subscribe(second);
            FAIL("expected already_subscribed");
        } catch (const engine_error& e) {
            CHECK(e.code() == engine_errc::already_subscribed);
        }
        CHECK(h.engine.events(second).size() == second_events.size());
    }

    TEST_CASE("009: finished workers are joined and old executions dropped", "[009][engine]") {
        detail::engine_harness h{"quill_engine_reap", engine_options{.max_retained_executions = 2U}};
        h.backend.set_script({detail::code_chunk("a.txt", "A\n"), detail::end_chunk()});
        auto pending = h.engine.submit("/implement make a file");
        (void)detail::drain(h.engine, pending);
        REQUIRE(h.engine.wait_until_settled(pending, 5s));
        REQUIRE(h.engine.get(pending).status == execution_status::awaiting_decision);

        std::vector<std::string> ids{};
        for (int i = 0; i < 4; ++i) {
            h.backend.set_script({detail::text_chunk("answer\n"), detail::end_chunk()});
            auto id = h.engine.submit("/ask question {}"_format(i));
            (void)detail::drain(h.engine, id);
            REQUIRE(h.engine.wait_until_settled(id, 5s));
            CHECK(h.engine.get(id).status == execution_status::completed);
            ids.push_back(id);
            // every earlier worker had returned before this submit
            CHECK(h.engine.worker_count() == 1U);
        }

        auto listed = h.engine.list();
        std::vector<std::string> listed_ids{};
        for (const auto& snapshot : listed) {
            listed_ids.push_back(snapshot.id);
        }
        CHECK(listed_ids == std::vector<std::string>{pending, ids[2], ids[3]});
        for (const auto& dropped : {ids[0], ids[1]}) {
            try {
                (void)h.engine.get(dropped);
                FAIL("expected unknown_execution");
            } catch (const engine_error& e) {
                CHECK(e.code() == engine_errc::unknown_execution);
            }
        }

        h.engine.decide(pending, "c1", decision::accept());
        (void)h.engine.commit(pending);
        CHECK(detail::read_file(h.path("a.txt")) == "A\n");
    }

    TEST_CASE("009: changes extracted before a cancel stay pending", "[009][engine]") {
        detail::engine_harness h{"quill_engine_cancel_mid"};
        detail::write_file(h.path("a.txt"), "alpha\n");
        h.backend.set_script(
                {detail::code_chunk("a.txt", "ALPHA\n"), detail::text_chunk("still going\n"), detail::end_chunk()},
                1U);

        auto id = h.engine.submit("/implement shout @a.txt");
        auto sub = h.engine.subscribe(id);
        std::vector<execution_event> events{};
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (std::chrono::steady_clock::now() < deadline &&
               (events.empty() || events.back().kind != event_kind::code_change_proposed)) {
            execution_event event{};
            if (sub.next(event, 100ms) == channel_state::ready) {
                events.push_back(std::move(event));
            }
        }
        REQUIRE_FALSE(events.empty());
        REQUIRE(events.back().kind == event_kind::code_change_proposed);

        h.engine.cancel(id);
        h.backend.release();
        for (;;) {
            REQUIRE(std::chrono::steady_clock::now() < deadline);
            execution_event event{};
            auto state = sub.next(event, 100ms);
            if (state == channel_state::finished) {
                break;
            }
            if (state == channel_state::ready) {
                events.push_back(std::move(event));
            }
        }
        CHECK(detail::last_event(events).kind == event_kind::cancelled);
        CHECK(std::ranges::count(detail::kinds_of(events), event_kind::cancelled) == 1);
        CHECK(std::ranges::none_of(events, [](const auto& e) { return e.text == "still going\n"; }));

        auto snapshot = h.engine.get(id);
        CHECK(snapshot.status == execution_status::cancelled);
        REQUIRE(snapshot.changes.size() == 1U);
        CHECK(snapshot.changes[0].status == change_status::pending);

        try {
            (void)h.engine.commit(id);
            FAIL("expected not_actionable");
        } catch (const engine_error& e) {
            CHECK(e.code() == engine_errc::not_actionable);
        }
        CHECK(detail::read_file(h.path("a.txt")) == "alpha\n");
    }

    TEST_CASE("009: invalid input is refused before dispatch", "[009][engine]") {
        detail::engine_harness h{"quill_engine_parse"};
        try {
            (void)h.engine.submit("/frobnicate now");
            FAIL("expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.code() == validation_status::unknown_verb);
        }
        CHECK(h.engine.list().empty());
        CHECK(h.backend.requests().empty());
    }

    TEST_CASE("009: a stream without an end marker completes as truncated", "[009][engine]") {
        detail::engine_harness h{"quill_engine_truncated"};
        h.backend.set_script({detail::text_chunk("```cpp src/cut.cpp\nint cut();\n"), detail::disconnected_chunk()});

        auto id = h.engine.submit("/implement cut");
        auto events = detail::drain(h.engine, id);

        const auto& done = detail::last_event(events);
        CHECK(done.kind == event_kind::completed);
        CHECK(done.truncated);
        CHECK(done.change_count == 1U);

        auto snapshot = h.engine.get(id);
        CHECK(snapshot.truncated);
        CHECK(detail::has_warning(snapshot, "backend closed the stream without an end marker"));
        CHECK(detail::has_warning(snapshot, "stream ended inside the block for src/cut.cpp"));
        REQUIRE(snapshot.changes.size() == 1U);
        CHECK(snapshot.changes[0].description == "create src/cut.cpp (truncated)");
        CHECK(snapshot.changes[0].modified == "int cut();\n");
    }

    TEST_CASE("009: a diff cut off by a disconnect still becomes a change", "[009][engine]") {
        detail::engine_harness h{"quill_engine_cut_diff"};
        detail::write_file(h.path("src/auth/jwt.ts"), "a\nb\nc\n");
        h.backend.set_script(
                {detail::text_chunk("```diff src/auth/jwt.ts\n@@ -1,3 +1,4 @@\n a\n+refresh\n b\n"),
                 detail::disconnected_chunk()});

        auto id = h.engine.submit("/implement add refresh token support");
        auto events = detail::drain(h.engine, id);

        const auto& done = detail::last_event(events);
        CHECK(done.kind == event_kind::completed);
        CHECK(done.truncated);
        CHECK(done.change_count == 1U);

        auto snapshot = h.engine.get(id);
        CHECK(snapshot.status == execution_status::awaiting_decision);
        REQUIRE(snapshot.changes.size() == 1U);
        CHECK(snapshot.changes[0].file_path == "src/auth/jwt.ts");
        CHECK(snapshot.changes[0].status == change_status::pending);
        CHECK(snapshot.changes[0].modified == "a\nrefresh\nb\nc\n");
        CHECK(snapshot.changes[0].description == "update src/auth/jwt.ts (truncated)");
        CHECK(detail::has_warning(snapshot, "stream ended inside the block for src/auth/jwt.ts"));
    }

    TEST_CASE("009: blocks embedded in text and diff blocks become changes", "[009][engine]") {
        detail::engine_harness h{"quill_engine_blocks"};
        detail::write_file(h.path("a.txt"), "one\ntwo\nthree\n");
        detail::write_file(h.path("same.txt"), "same\n");
        h.backend.set_script(
                {detail::diff_chunk("a.txt", "--- a/a.txt\n+++ b/a.txt\n@@ -1,3 +1,3 @@\n one\n-two\n+TWO\n three\n"),
                 detail::code_chunk("../escape.txt", "x\n"),
                 detail::diff_chunk("missing.txt", "@@ -1 +1 @@\n-old\n+new\n"),
                 detail::code_chunk("same.txt", "same\n"),
                 detail::text_chunk("Also:\n```txt notes/n.txt\nnote v1\n```\n"),
                 detail::text_chunk("Revised:\n```txt notes/n.txt\nnote v2\n```\n"),
                 detail::end_chunk()});

        auto id = h.engine.submit("/implement many things");
        auto events = detail::drain(h.engine, id);
        CHECK(std::ranges::count(detail::kinds_of(events), event_kind::code_change_proposed) == 3);

        auto snapshot = h.engine.get(id);
        REQUIRE(snapshot.changes.size() == 2U);
        CHECK(snapshot.changes[0].id == "c1");
        CHECK(snapshot.changes[0].file_path == "a.txt");
        CHECK(snapshot.changes[0].modified == "one\nTWO\nthree\n");
        CHECK(snapshot.changes[0].start_line == 2U);
        CHECK(snapshot.changes[0].end_line == 2U);
        CHECK(snapshot.changes[1].id == "c2");
        CHECK(snapshot.changes[1].file_path == "notes/n.txt");
        CHECK(snapshot.changes[1].modified == "note v2\n");

        CHECK(detail::has_warning(snapshot, "ignored change outside the workspace: ../escape.txt"));
        CHECK(detail::has_warning(snapshot, "diff for missing.txt does not apply; change ignored"));
    }

    TEST_CASE("009: unreadable context fails the execution", "[009][engine]") {
        detail::engine_harness h{"quill_engine_ctx_fail"};
        auto id = h.engine.submit("/review @missing.txt");
        auto events = detail::drain(h.engine, id);

        CHECK(detail::kinds_of(events) == std::vector<event_kind>{event_kind::started, event_kind::error});
        CHECK(events[1].error_kind == "context.not_found");

        auto snapshot = h.engine.get(id);
        CHECK(snapshot.status == execution_status::failed);
        REQUIRE(snapshot.failure);
        CHECK(snapshot.failure->category == "context");
        CHECK(snapshot.failure->kind == "not_found");
        CHECK(h.backend.requests().empty());
    }

    TEST_CASE("009: a silent backend times out", "[009][engine]") {
        detail::engine_harness h{"quill_engine_timeout", engine_options{.connect_timeout = 100ms}};
        h.backend.set_script({}, 0U);

        auto id = h.engine.submit("/ask anyone there");
        auto events = detail::drain(h.engine, id);
        const auto& last = detail::last_event(events);
        CHECK(last.kind == event_kind::error);
        CHECK(last.error_kind == "execution.timeout");
        CHECK(last.text == "backend produced no output within 100ms");
        CHECK(h.backend.closes() >= 1U);
    }

    TEST_CASE("009: an unreachable backend fails the execution", "[009][engine]") {
        detail::engine_harness h{"quill_engine_unreachable"};
        h.backend.unreachable = true;

        auto id = h.engine.submit("/ask hello");
        auto events = detail::drain(h.engine, id);
        CHECK(detail::last_event(events).error_kind == "execution.backend_unreachable");
        CHECK(detail::last_event(events).text == "backend is down");
        CHECK(h.engine.get(id).status == execution_status::failed);
    }

    TEST_CASE("009: help and dry runs never reach the backend", "[009][engine]") {
        detail::engine_harness h{"quill_engine_local"};
        detail::write_file(h.path("a.txt"), "a\n");

        auto help = h.engine.submit("/help");
        auto help_events = detail::drain(h.engine, help);
        CHECK(detail::kinds_of(help_events) ==
              std::vector<event_kind>{event_kind::started, event_kind::progress, event_kind::completed});
        CHECK(help_events[1].text == command_reference());
        CHECK(h.engine.get(help).status == execution_status::completed);

        auto dry = h.engine.submit("/implement refactor @a.txt --dry-run");
        auto dry_events = detail::drain(h.engine, dry);
        REQUIRE(dry_events.size() == 4U);
        CHECK(dry_events[1].kind == event_kind::file_read);
        CHECK(dry_events[2].text.starts_with("dry run: 1 file(s), 0 knowledge snippet(s)"));
        CHECK(detail::contains(dry_events[2].text, "  a.txt (2 bytes)\n"));

        CHECK(h.backend.requests().empty());
    }

    TEST_CASE("009: the backend request carries context and prior decisions", "[009][engine]") {
        detail::engine_harness h{"quill_engine_request", engine_options{.system_prompt = "Be brief."}};
        detail::write_file(h.path("a.txt"), "a\n");
        h.knowledge.snippets = {{"retry with backoff", "docs/net.md", 0.8}};

        h.backend.set_script({detail::code_chunk("a.txt", "A\n"), detail::end_chunk()});
        auto first = h.engine.submit("/implement shout");
        (void)detail::drain(h.engine, first);
        h.engine.decide(first, "c1", decision::reject());
        auto empty = h.engine.commit(first);
        CHECK(empty.written_paths.empty());
        CHECK(h.engine.get(first).status == execution_status::completed);

        h.backend.set_script({detail::text_chunk("plan"), detail::end_chunk()});
        auto second = h.engine.submit("/implement rollout @a.txt --model=deep --no-verify");
        (void)detail::drain(h.engine, second);

        auto requests = h.backend.requests();
        REQUIRE(requests.size() == 2U);
        const auto& request = requests[1];
        CHECK(request.system_prompt == "Be brief.\n\n" + std::string{verb_preamble("implement")});
        CHECK(request.user_request == "rollout @a.txt");
        CHECK(request.verb == "implement");
        CHECK(request.model == std::optional<std::string>{"deep"});
        CHECK(request.flags.at("model") == "deep");
        CHECK(request.flags.at("no-verify") == "true");
        REQUIRE(request.files.size() == 1U);
        CHECK(request.files[0].path == "a.txt");
        CHECK(request.files[0].content == "a\n");
        REQUIRE(request.knowledge.size() == 1U);
        CHECK(request.knowledge[0].provenance == "docs/net.md");
        REQUIRE(request.prior_decisions.size() == 1U);
        CHECK(request.prior_decisions[0] == "reject a.txt ({}/c1)"_format(first));

        CHECK(requests[0].system_prompt.starts_with("Be brief.\n\n"));
        CHECK(requests[0].user_request == "shout");
    }

    TEST_CASE("009: knowledge failures surface as execution warnings", "[009][engine]") {
        detail::engine_harness h{"quill_engine_kb_warn"};
        h.knowledge.failure = "index offline";
        h.backend.set_script({detail::text_chunk("ok"), detail::end_chunk()});

        auto id = h.engine.submit("where is the cache");
        auto events = detail::drain(h.engine, id);
        CHECK(detail::last_event(events).kind == event_kind::completed);
        CHECK(detail::has_warning(h.engine.get(id), "knowledge service unavailable: index offline"));
        CHECK(h.engine.get(id).command.verb == "ask");
    }

}  // namespace quill::test
