#include "utils.hpp"

namespace quill::test {

    namespace detail {
        static change make_change(
                std::string id,
                std::string path,
                std::string original,
                std::string modified,
                change_status status = change_status::accepted,
                bool original_exists = true) {
            return change{
                    .id = std::move(id),
                    .file_path = std::move(path),
                    .original = std::move(original),
                    .original_exists = original_exists,
                    .modified = std::move(modified),
                    .status = status};
        }

        static size_t count_temporaries(const fs::path& dir) {
            size_t count = 0U;
            for (const auto& entry : fs::recursive_directory_iterator(dir)) {
                if (contains(entry.path().filename().string(), ".quill-")) {
                    ++count;
                }
            }
            return count;
        }
    }  // namespace detail

    TEST_CASE("007: accepted changes are written and recorded", "[007][applier]") {
        detail::temp_dir temp{"quill_apply_basic"};
        detail::write_file(temp.path / "a.txt", "alpha\n");
        workspace ws{temp.path};
        change_applier applier{ws};

        std::vector<change> batch{
                detail::make_change("c1", "a.txt", "alpha\n", "ALPHA\n"),
                detail::make_change("c2", "new/b.txt", "", "beta\n", change_status::modified, false)};
        auto result = applier.apply_changes("ex-1", batch);

        CHECK(result.written_paths == std::vector<std::string>{"a.txt", "new/b.txt"});
        REQUIRE(result.revert_handle.size() == 2U);
        CHECK(result.revert_handle[0] == change_ref{"ex-1", "c1"});
        CHECK(detail::read_file(temp.path / "a.txt") == "ALPHA\n");
        CHECK(detail::read_file(temp.path / "new/b.txt") == "beta\n");
        CHECK(batch[0].status == change_status::applied);
        CHECK(batch[1].status == change_status::applied);
        CHECK(detail::count_temporaries(temp.path) == 0U);

        auto entry = applier.find({"ex-1", "c2"});
        REQUIRE(entry);
        CHECK_FALSE(entry->before_existed);
        CHECK(entry->after == "beta\n");
        CHECK(applier.ledger().size() == 2U);
    }

    TEST_CASE("007: changes that are not accepted refuse the whole batch", "[007][applier]") {
        detail::temp_dir temp{"quill_apply_state"};
        detail::write_file(temp.path / "a.txt", "alpha\n");
        detail::write_file(temp.path / "b.txt", "beta\n");
        workspace ws{temp.path};
        change_applier applier{ws};

        std::vector<change> batch{
                detail::make_change("c1", "a.txt", "alpha\n", "ALPHA\n"),
                detail::make_change("c2", "b.txt", "beta\n", "BETA\n", change_status::pending)};
        try {
            (void)applier.apply_changes("ex-1", batch);
            FAIL("expected invalid_change_state");
        } catch (const apply_error& e) {
            CHECK(e.code() == apply_errc::invalid_change_state);
            REQUIRE(e.change_id());
            CHECK(*e.change_id() == "c2");
        }
        CHECK(detail::read_file(temp.path / "a.txt") == "alpha\n");
        CHECK(batch[0].status == change_status::accepted);
        CHECK(applier.ledger().empty());

        std::vector<change> duplicate{
                detail::make_change("c1", "a.txt", "alpha\n", "A1\n"),
                detail::make_change("c2", "./a.txt", "alpha\n", "A2\n")};
        try {
            (void)applier.apply_changes("ex-2", duplicate);
            FAIL("expected invalid_change_state");
        } catch (const apply_error& e) {
            CHECK(e.code() == apply_errc::invalid_change_state);
        }

        std::vector<change> escaping{detail::make_change("c1", "../outside.txt", "", "x\n")};
        CHECK_THROWS_AS(applier.apply_changes("ex-3", escaping), apply_error);
    }

    TEST_CASE("007: a file edited since the proposal is stale", "[007][applier]") {
        detail::temp_dir temp{"quill_apply_stale"};
        detail::write_file(temp.path / "a.txt", "alpha\n");
        detail::write_file(temp.path / "b.txt", "beta\n");
        workspace ws{temp.path};
        change_applier applier{ws};

        std::vector<change> batch{
                detail::make_change("c1", "a.txt", "alpha\n", "ALPHA\n"),
                detail::make_change("c2", "b.txt", "beta\n", "BETA\n")};
        detail::write_file(temp.path / "b.txt", "beta edited by hand\n");

        try {
            (void)applier.apply_changes("ex-1", batch);
            FAIL("expected stale_change");
        } catch (const apply_error& e) {
            CHECK(e.code() == apply_errc::stale_change);
            CHECK(e.change_id() == std::optional<std::string>{"c2"});
        }
        CHECK(detail::read_file(temp.path / "a.txt") == "alpha\n");
        CHECK(detail::read_file(temp.path / "b.txt") == "beta edited by hand\n");

        std::vector<change> creates{detail::make_change("c1", "a.txt", "", "new\n", change_status::accepted, false)};
        try {
            (void)applier.apply_changes("ex-2", creates);
            FAIL("expected stale_change");
        } catch (const apply_error& e) {
            CHECK(e.code() == apply_errc::stale_change);
        }

        std::filesystem::remove(temp.path / "b.txt");
        std::vector<change> removed{detail::make_change("c1", "b.txt", "beta\n", "BETA\n")};
        CHECK_THROWS_AS(applier.apply_changes("ex-3", removed), apply_error);
    }

    TEST_CASE("007: a staging failure leaves every file untouched", "[007][applier]") {
        detail::temp_dir temp{"quill_apply_rollback"};
        detail::write_file(temp.path / "a.txt", "alpha\n");
        detail::write_file(temp.path / "blocker", "a regular file where a directory is needed\n");
        workspace ws{temp.path};
        change_applier applier{ws};

        std::vector<change> batch{
                detail::make_change("c1", "a.txt", "alpha\n", "ALPHA\n"),
                detail::make_change("c2", "blocker/child.txt", "", "child\n", change_status::accepted, false)};
        try {
            (void)applier.apply_changes("ex-1", batch);
            FAIL("expected io_failure");
        } catch (const apply_error& e) {
            CHECK(e.code() == apply_errc::io_failure);
            CHECK(e.change_id() == std::optional<std::string>{"c2"});
        }
        CHECK(detail::read_file(temp.path / "a.txt") == "alpha\n");
        CHECK(detail::count_temporaries(temp.path) == 0U);
        CHECK(applier.ledger().empty());
    }

    TEST_CASE("007: revert restores prior bytes and removes created files", "[007][applier]") {
        detail::temp_dir temp{"quill_apply_revert"};
        detail::write_file(temp.path / "a.txt", "alpha\n");
        workspace ws{temp.path};
        change_applier applier{ws};

        std::vector<change> batch{
                detail::make_change("c1", "a.txt", "alpha\n", "ALPHA\n"),
                detail::make_change("c2", "made.txt", "", "made\n", change_status::accepted, false)};
        auto result = applier.apply_changes("ex-1", batch);

        auto restored = applier.revert_changes(result.revert_handle);
        CHECK(restored == std::vector<std::string>{"a.txt", "made.txt"});
        CHECK(detail::read_file(temp.path / "a.txt") == "alpha\n");
        CHECK_FALSE(std::filesystem::exists(temp.path / "made.txt"));

        auto entry = applier.find({"ex-1", "c1"});
        REQUIRE(entry);
        CHECK(entry->status == change_status::reverted);
        CHECK(entry->reverted_at_ms);

        try {
            (void)applier.revert_changes(result.revert_handle);
            FAIL("expected already_reverted");
        } catch (const apply_error& e) {
            CHECK(e.code() == apply_errc::already_reverted);
        }
        try {
            (void)applier.revert_changes({{"ex-9", "c1"}});
            FAIL("expected not_applied");
        } catch (const apply_error& e) {
            CHECK(e.code() == apply_errc::not_applied);
        }
    }

    TEST_CASE("007: the ledger survives a restart and still reverts", "[007][applier]") {
        detail::temp_dir temp{"quill_apply_ledger"};
        detail::write_file(temp.path / "a.txt", "alpha\n");
        workspace ws{temp.path};
        auto ledger_path = temp.path / ".quill" / "ledger.json";

        std::vector<change_ref> handle{};
        {
            change_applier applier{ws, ledger_path};
            std::vector<change> batch{detail::make_change("c1", "a.txt", "alpha\n", "ALPHA\n")};
            handle = applier.apply_changes("ex-1", batch).revert_handle;
        }
        REQUIRE(std::filesystem::exists(ledger_path));

        change_applier reopened{ws, ledger_path};
        REQUIRE(reopened.ledger().size() == 1U);
        CHECK(reopened.ledger().front().status == change_status::applied);

        (void)reopened.revert_changes(handle);
        CHECK(detail::read_file(temp.path / "a.txt") == "alpha\n");

        change_applier third{ws, ledger_path};
        REQUIRE(third.find({"ex-1", "c1"}));
        CHECK(third.find({"ex-1", "c1"})->status == change_status::reverted);
    }

    TEST_CASE("007: reverted entries shed their bytes and only the newest are kept", "[007][applier]") {
        detail::temp_dir temp{"quill_apply_compact"};
        detail::write_file(temp.path / "a.txt", "v0\n");
        workspace ws{temp.path};
        auto ledger_path = temp.path / ".quill" / "ledger.json";

        {
            change_applier applier{ws, ledger_path, 2U};
            for (int i = 1; i <= 4; ++i) {
                auto execution_id = "ex-{}"_format(i);
                std::vector<change> batch{detail::make_change("c1", "a.txt", "v0\n", "v{}\n"_format(i))};
                auto result = applier.apply_changes(execution_id, batch);
                (void)applier.revert_changes(result.revert_handle);
            }
            std::vector<change> kept{detail::make_change("c1", "a.txt", "v0\n", "final\n")};
            (void)applier.apply_changes("ex-5", kept);

            auto entries = applier.ledger();
            REQUIRE(entries.size() == 3U);
            CHECK(entries[0].ref == change_ref{"ex-3", "c1"});
            CHECK(entries[1].ref == change_ref{"ex-4", "c1"});
            CHECK(entries[0].before.empty());
            CHECK(entries[0].after.empty());
            CHECK(entries[2].status == change_status::applied);
            CHECK(entries[2].before == "v0\n");
            CHECK_FALSE(applier.find({"ex-1", "c1"}));
        }

        change_applier reopened{ws, ledger_path, 2U};
        CHECK(reopened.ledger().size() == 3U);
        (void)reopened.revert_changes({{"ex-5", "c1"}});
        CHECK(detail::read_file(temp.path / "a.txt") == "v0\n");
        CHECK(reopened.ledger().size() == 3U);
        CHECK(reopened.ledger().front().ref == change_ref{"ex-4", "c1"});
    }

    TEST_CASE("007: a ledger from a newer schema is refused", "[007][applier]") {
        detail::temp_dir temp{"quill_apply_schema"};
        workspace ws{temp.path};
        auto ledger_path = temp.path / "ledger.json";
        detail::write_file(ledger_path, R"({"schema_version":5,"entries":[]})");
        CHECK_THROWS_AS(change_applier(ws, ledger_path), std::runtime_error);
    }

}  // namespace quill::test
