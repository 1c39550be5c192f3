#include "utils.hpp"

namespace quill::test {

    using internal::block_extractor;
    using internal::extracted_block;

    TEST_CASE("005: info strings name the target file in several forms", "[005][extractor]") {
        block_extractor extractor{};
        auto blocks = extractor.feed(
                "intro text\n"
                "```cpp src/a.cpp\nint a;\n```\n"
                "```cpp:src/b.cpp\nint b;\n```\n"
                "```python path=tools/c.py\nc = 1\n```\n"
                "```docs/d.md\n# d\n```\n"
                "```ts file=web/e.ts\nlet e;\n```\n");
        REQUIRE(blocks.size() == 5U);
        CHECK(blocks[0].path == "src/a.cpp");
        CHECK(blocks[0].language == "cpp");
        CHECK(blocks[0].content == "int a;\n");
        CHECK(blocks[1].path == "src/b.cpp");
        CHECK(blocks[1].language == "cpp");
        CHECK(blocks[2].path == "tools/c.py");
        CHECK(blocks[2].language == "python");
        CHECK(blocks[3].path == "docs/d.md");
        CHECK(blocks[3].language.empty());
        CHECK(blocks[4].path == "web/e.ts");
        for (const auto& block : blocks) {
            CHECK_FALSE(block.is_diff);
            CHECK_FALSE(block.truncated);
        }
        CHECK_FALSE(extractor.in_block());
    }

    TEST_CASE("005: blocks without a target are skipped", "[005][extractor]") {
        block_extractor extractor{};
        auto blocks = extractor.feed("```cpp\nint orphan;\n```\n```bash\nls\n```\n```bash title\necho hi\n```\n");
        CHECK(blocks.empty());
        CHECK_FALSE(extractor.in_block());
        CHECK_FALSE(extractor.finish());
    }

    TEST_CASE("005: text split across arbitrary chunks", "[005][extractor]") {
        std::string stream = "Here is the fix:\n```cpp src/fix.cpp\nint fixed() {\n    return 1;\n}\n```\nDone.\n";
        block_extractor extractor{};
        std::vector<extracted_block> blocks{};
        for (size_t i = 0U; i < stream.size(); i += 3U) {
            auto piece = std::string_view{stream}.substr(i, 3U);
            for (auto& block : extractor.feed(piece)) {
                blocks.push_back(std::move(block));
            }
        }
        REQUIRE(blocks.size() == 1U);
        CHECK(blocks[0].path == "src/fix.cpp");
        CHECK(blocks[0].content == "int fixed() {\n    return 1;\n}\n");
        CHECK_FALSE(extractor.finish());
    }

    TEST_CASE("005: diff blocks take their path from the +++ header", "[005][extractor]") {
        block_extractor extractor{};
        auto blocks = extractor.feed(
                "```diff\n"
                "--- a/src/x.cpp\n"
                "+++ b/src/x.cpp\n"
                "@@ -1 +1 @@\n"
                "-int x = 1;\n"
                "+int x = 2;\n"
                "```\n");
        REQUIRE(blocks.size() == 1U);
        CHECK(blocks[0].is_diff);
        CHECK(blocks[0].path == "src/x.cpp");
        CHECK(detail::contains(blocks[0].content, "+int x = 2;\n"));

        auto named = extractor.feed("```patch lib/y.hpp\n@@ -1 +1 @@\n-a\n+b\n```\n");
        REQUIRE(named.size() == 1U);
        CHECK(named[0].is_diff);
        CHECK(named[0].path == "lib/y.hpp");
    }

    TEST_CASE("005: longer fences and tildes close only on a matching fence", "[005][extractor]") {
        block_extractor extractor{};
        auto blocks = extractor.feed(
                "````md README.md\n"
                "```cpp\n"
                "int inner;\n"
                "```\n"
                "````\n"
                "~~~ notes/n.txt\n"
                "```\n"
                "~~~\n");
        REQUIRE(blocks.size() == 2U);
        CHECK(blocks[0].path == "README.md");
        CHECK(blocks[0].content == "```cpp\nint inner;\n```\n");
        CHECK(blocks[1].path == "notes/n.txt");
        CHECK(blocks[1].content == "```\n");
    }

    TEST_CASE("005: an unterminated block is returned as truncated by finish", "[005][extractor]") {
        block_extractor extractor{};
        CHECK(extractor.feed("```cpp src/cut.cpp\nint cut() {\n    return").empty());
        CHECK(extractor.in_block());

        auto open = extractor.finish();
        REQUIRE(open);
        CHECK(open->truncated);
        CHECK(open->path == "src/cut.cpp");
        CHECK(open->content == "int cut() {\n    return\n");
        CHECK_FALSE(extractor.in_block());
    }

    TEST_CASE("005: a closing fence without a trailing newline still completes", "[005][extractor]") {
        block_extractor extractor{};
        CHECK(extractor.feed("```txt a.txt\nhello\n```").empty());
        auto last = extractor.finish();
        REQUIRE(last);
        CHECK_FALSE(last->truncated);
        CHECK(last->content == "hello\n");
    }

    TEST_CASE("005: carriage returns are stripped from lines", "[005][extractor]") {
        block_extractor extractor{};
        auto blocks = extractor.feed("```cpp win.cpp\r\nint w;\r\n```\r\n");
        REQUIRE(blocks.size() == 1U);
        CHECK(blocks[0].path == "win.cpp");
        CHECK(blocks[0].content == "int w;\n");
    }

}  // namespace quill::test
