#include "utils.hpp"

namespace quill::test {

    namespace detail {
        static std::string numbered_lines(size_t count) {
            std::string out{};
            for (size_t i = 1U; i <= count; ++i) {
                out += "line " + std::to_string(i) + "\n";
            }
            return out;
        }
    }  // namespace detail

    TEST_CASE("004: change status transitions follow the decision lifecycle", "[004][change]") {
        CHECK(can_transition(change_status::pending, change_status::accepted));
        CHECK(can_transition(change_status::pending, change_status::rejected));
        CHECK(can_transition(change_status::rejected, change_status::accepted));
        CHECK(can_transition(change_status::accepted, change_status::modified));
        CHECK(can_transition(change_status::modified, change_status::applied));
        CHECK(can_transition(change_status::applied, change_status::reverted));

        CHECK_FALSE(can_transition(change_status::pending, change_status::applied));
        CHECK_FALSE(can_transition(change_status::rejected, change_status::applied));
        CHECK_FALSE(can_transition(change_status::applied, change_status::accepted));
        CHECK_FALSE(can_transition(change_status::reverted, change_status::applied));
        CHECK_FALSE(can_transition(change_status::accepted, change_status::pending));

        change c{.id = "c1", .file_path = "a.txt", .original = "a\n", .modified = "b\n"};
        CHECK_FALSE(c.is_applicable());
        CHECK(c.try_transition(change_status::accepted));
        CHECK(c.is_applicable());
        CHECK(c.try_transition(change_status::applied));
        CHECK_FALSE(c.try_transition(change_status::rejected));
        CHECK(c.status == change_status::applied);

        change_status parsed{};
        CHECK(try_parse_change_status("Modified", parsed));
        CHECK(parsed == change_status::modified);
        CHECK_FALSE(try_parse_change_status("merged", parsed));
    }

    TEST_CASE("004: identical inputs produce no hunks", "[004][diff]") {
        CHECK(generate_diff("a\nb\n", "a\nb\n").empty());
        CHECK(generate_diff("", "").empty());
        CHECK(compute_anchor("same\n", "same\n").start_line == 0U);
    }

    TEST_CASE("004: a single line edit renders as a unified diff", "[004][diff]") {
        auto hunks = generate_diff("a\nb\nc\n", "a\nB\nc\n");
        REQUIRE(hunks.size() == 1U);
        const auto& hunk = hunks.front();
        CHECK(hunk.old_start == 1U);
        CHECK(hunk.old_count == 3U);
        CHECK(hunk.new_start == 1U);
        CHECK(hunk.new_count == 3U);
        REQUIRE(hunk.lines.size() == 4U);
        CHECK(hunk.lines[1].kind == diff_line_kind::deletion);
        CHECK(hunk.lines[1].old_line == 2U);
        CHECK(hunk.lines[2].kind == diff_line_kind::addition);
        CHECK(hunk.lines[2].new_line == 2U);

        auto text = format_unified_diff("src/a.txt", hunks);
        CHECK(text == "--- a/src/a.txt\n+++ b/src/a.txt\n@@ -1,3 +1,3 @@\n a\n-b\n+B\n c\n");
    }

    TEST_CASE("004: distant edits split into separate hunks", "[004][diff]") {
        auto original = detail::numbered_lines(30);
        auto modified = original;
        modified.replace(modified.find("line 2\n"), 7, "line two\n");
        modified.replace(modified.find("line 28\n"), 8, "line twenty-eight\n");

        auto hunks = generate_diff(original, modified);
        REQUIRE(hunks.size() == 2U);
        CHECK(hunks[0].old_start == 1U);
        CHECK(hunks[1].old_start == 25U);

        auto single = generate_diff(original, modified, 20U);
        CHECK(single.size() == 1U);
    }

    TEST_CASE("004: generated diffs apply back onto the original", "[004][diff]") {
        auto original = detail::numbered_lines(12);
        auto modified = original;
        modified.replace(modified.find("line 6\n"), 7, "line six\nline six and a half\n");
        modified.erase(modified.find("line 11\n"), 8);

        auto diff = format_unified_diff("n.txt", generate_diff(original, modified));
        auto patched = apply_unified_diff(original, diff);
        REQUIRE(patched);
        CHECK(*patched == modified);
    }

    TEST_CASE("004: hunks are located near a shifted position", "[004][diff]") {
        auto original = "header one\nheader two\n" + detail::numbered_lines(6);
        std::string diff =
                "--- a/f\n+++ b/f\n"
                "@@ -2,3 +2,3 @@\n"
                " line 2\n"
                "-line 3\n"
                "+line three\n"
                " line 4\n";
        auto patched = apply_unified_diff(original, diff);
        REQUIRE(patched);
        CHECK(detail::contains(*patched, "line 2\nline three\nline 4\n"));
        CHECK(patched->starts_with("header one\n"));
    }

    TEST_CASE("004: diffs that do not match are refused", "[004][diff]") {
        std::string diff =
                "--- a/f\n+++ b/f\n"
                "@@ -1,2 +1,2 @@\n"
                " alpha\n"
                "-beta\n"
                "+gamma\n";
        CHECK_FALSE(apply_unified_diff("one\ntwo\n", diff));
        CHECK_FALSE(apply_unified_diff("alpha\nbeta\n", "no hunks here\n"));
        CHECK_FALSE(apply_unified_diff("alpha\nbeta\n", "@@ -1,2 +1,2 @@\n alpha\n"));
    }

    TEST_CASE("004: a diff cut off mid-hunk applies what it carries", "[004][diff]") {
        auto cut = apply_truncated_unified_diff("a\nb\nc\n", "@@ -1,3 +1,4 @@\n a\n+refresh\n b\n");
        REQUIRE(cut);
        CHECK(*cut == "a\nrefresh\nb\nc\n");

        std::string two_hunks =
                "@@ -1,2 +1,2 @@\n"
                "-one\n"
                "+ONE\n"
                " two\n"
                "@@ -9,2 +9,2 @@\n"
                " nine\n"
                "-te";
        auto first_only = apply_truncated_unified_diff("one\ntwo\n", two_hunks);
        REQUIRE(first_only);
        CHECK(*first_only == "ONE\ntwo\n");

        // the last line was cut inside a word
        auto partial_line = apply_truncated_unified_diff("alpha\nbeta\n", "@@ -1,2 +1,2 @@\n-alpha\n+ALPHA\n be\n");
        REQUIRE(partial_line);
        CHECK(*partial_line == "ALPHA\nbeta\n");

        CHECK_FALSE(apply_unified_diff("a\nb\nc\n", "@@ -1,3 +1,4 @@\n a\n+refresh\n b\n"));
        CHECK_FALSE(apply_truncated_unified_diff("a\n", "@@ -1 +1 @@\n"));
        CHECK_FALSE(apply_truncated_unified_diff("a\n", "@@ -1,2 +1,2 @@\n x\n-y\n"));
    }

    TEST_CASE("004: diffs can create files and drop trailing newlines", "[004][diff]") {
        std::string create =
                "--- /dev/null\n+++ b/new.txt\n"
                "@@ -0,0 +1,2 @@\n"
                "+first\n"
                "+second\n";
        auto created = apply_unified_diff("", create);
        REQUIRE(created);
        CHECK(*created == "first\nsecond\n");

        std::string no_newline =
                "--- a/f\n+++ b/f\n"
                "@@ -1 +1 @@\n"
                "-old\n"
                "+new\n"
                "\\ No newline at end of file\n";
        auto patched = apply_unified_diff("old\n", no_newline);
        REQUIRE(patched);
        CHECK(*patched == "new");
    }

    TEST_CASE("004: diff target comes from the +++ header", "[004][diff]") {
        CHECK(unified_diff_target("--- a/x.cpp\n+++ b/src/x.cpp\n@@ -1 +1 @@\n-a\n+b\n") == "src/x.cpp");
        CHECK(unified_diff_target("+++ lib/y.hpp\t2024-01-01 10:00:00\n") == "lib/y.hpp");
        CHECK_FALSE(unified_diff_target("--- a/x\n+++ /dev/null\n"));
        CHECK_FALSE(unified_diff_target("@@ -1 +1 @@\n"));
    }

    TEST_CASE("004: anchors cover the touched range of the original", "[004][diff]") {
        auto edit = compute_anchor("a\nb\nc\nd\n", "a\nB\nC\nd\n");
        CHECK(edit.start_line == 2U);
        CHECK(edit.end_line == 3U);

        auto insertion = compute_anchor("a\nb\n", "a\nx\nb\n");
        CHECK(insertion.start_line == 1U);
        CHECK(insertion.end_line == 1U);

        auto spread = compute_anchor(detail::numbered_lines(20), [] {
            auto text = detail::numbered_lines(20);
            text.replace(text.find("line 3\n"), 7, "THREE\n");
            text.replace(text.find("line 17\n"), 8, "SEVENTEEN\n");
            return text;
        }());
        CHECK(spread.start_line == 3U);
        CHECK(spread.end_line == 17U);

        auto created = compute_anchor("", "new\nfile\n");
        CHECK(created.start_line == 1U);
        CHECK(created.end_line == 1U);
    }

}  // namespace quill::test
