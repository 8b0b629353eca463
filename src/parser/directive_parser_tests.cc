#include "parser/directive_parser.hpp"

#include <doctest.h>

using namespace mender;

TEST_CASE("directive_parser") {
    SUBCASE("search_replace") {
        auto patches = parse_directives(
            "src/main.rs\n"
            "<<<<<<< SEARCH\n"
            "old\n"
            "=======\n"
            "new\n"
            ">>>>>>> REPLACE\n");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0] == Patch::Modify("src/main.rs", "old\n", "new\n"));
    }

    SUBCASE("fenced") {
        auto patches = parse_directives(
            "Here is the change:\n"
            "\n"
            "src/main.rs\n"
            "```rust\n"
            "<<<<<<< SEARCH\n"
            "fn main() {}\n"
            "=======\n"
            "fn main() { run(); }\n"
            ">>>>>>> REPLACE\n"
            "```\n");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].file_path == "src/main.rs");
        REQUIRE(patches[0].as_modify().search == "fn main() {}\n");
    }

    SUBCASE("indented_markers") {
        auto patches = parse_directives(
            "\n"
            "    file1.rs\n"
            "      <<<<<<< SEARCH\n"
            "    old\n"
            "    =======\n"
            "    new\n"
            "    >>>>>>> REPLACE\n"
            "    ");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].file_path == "file1.rs");
        REQUIRE(patches[0].as_modify().search == "    old\n");
        REQUIRE(patches[0].as_modify().replace == "    new\n");
    }

    SUBCASE("marker_preceded_by_text") {
        auto patches = parse_directives(
            "\n"
            "    file2.rs\n"
            "    some_code <<<<<<< SEARCH\n"
            "    old\n"
            "    =======\n"
            "    new\n"
            "    >>>>>>> REPLACE\n");
        REQUIRE(patches.empty());
    }

    SUBCASE("empty_search_block") {
        auto patches = parse_directives(
            "new_file.txt\n"
            "<<<<<<< SEARCH\n"
            "=======\n"
            "hello\n"
            ">>>>>>> REPLACE\n");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].as_modify().is_creation());
        REQUIRE(patches[0].as_modify().replace == "hello\n");
    }

    SUBCASE("path_is_kept_for_following_blocks") {
        auto patches = parse_directives(
            "a.txt\n"
            "<<<<<<< SEARCH\n"
            "one\n"
            "=======\n"
            "1\n"
            ">>>>>>> REPLACE\n"
            "<<<<<<< SEARCH\n"
            "two\n"
            "=======\n"
            "2\n"
            ">>>>>>> REPLACE\n");
        REQUIRE(patches.size() == 2);
        REQUIRE(patches[0].file_path == "a.txt");
        REQUIRE(patches[1].file_path == "a.txt");
        REQUIRE(patches[1].as_modify().search == "two\n");
    }

    SUBCASE("block_without_path_is_dropped") {
        auto patches = parse_directives(
            "<<<<<<< SEARCH\n"
            "old\n"
            "=======\n"
            "new\n"
            ">>>>>>> REPLACE\n");
        REQUIRE(patches.empty());
    }

    SUBCASE("unterminated_block_is_dropped") {
        auto patches = parse_directives(
            "a.txt\n"
            "<<<<<<< SEARCH\n"
            "old\n"
            "=======\n"
            "new\n");
        REQUIRE(patches.empty());
    }

    SUBCASE("move_delete") {
        auto patches = parse_directives(
            "file_to_delete.rs <<<<<<< DELETE\n"
            "src/old.rs <<<<<<< MOVE >>>>>>> src/new.rs");
        REQUIRE(patches.size() == 2);
        REQUIRE(patches[0] == Patch::Delete("file_to_delete.rs"));
        REQUIRE(patches[1] == Patch::Move("src/old.rs", "src/new.rs"));
    }

    SUBCASE("command_is_not_a_path_line") {
        auto patches = parse_directives(
            "a.txt <<<<<<< DELETE\n"
            "<<<<<<< SEARCH\n"
            "x\n"
            "=======\n"
            "y\n"
            ">>>>>>> REPLACE\n");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].is_delete());
    }

    SUBCASE("udiff") {
        auto patches = parse_directives(
            "--- hello.py\n"
            "+++ hello.py\n"
            "@@ -1,2 +1,3 @@\n"
            " def hello():\n"
            "+    print('Hello')\n"
            "     pass\n");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].is_udiff());
        REQUIRE(patches[0].file_path == "hello.py");

        const auto& hunks = patches[0].as_udiff().hunks;
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].old_start == 1);
        REQUIRE(hunks[0].old_len == 2);
        REQUIRE(hunks[0].new_len == 3);
        REQUIRE(hunks[0].lines.size() == 3);
        REQUIRE(hunks[0].lines[0] == HunkLine::Context("def hello():\n"));
        REQUIRE(hunks[0].lines[1] == HunkLine::Add("    print('Hello')\n"));
        REQUIRE(hunks[0].lines[2] == HunkLine::Context("    pass\n"));
    }

    SUBCASE("udiff_no_newline_marker") {
        auto patches = parse_directives(
            "--- a.txt\n"
            "+++ a.txt\n"
            "@@ -1 +1 @@\n"
            "-old\n"
            "\\ No newline at end of file\n"
            "+new\n");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].as_udiff().hunks[0].lines.size() == 2);
    }

    SUBCASE("udiff_creation") {
        auto patches = parse_directives(
            "--- /dev/null\n"
            "+++ b/src/new.txt\n"
            "@@ -0,0 +1,2 @@\n"
            "+first\n"
            "+second\n");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].is_udiff());
        REQUIRE(patches[0].file_path == "src/new.txt");
        REQUIRE(patches[0].as_udiff().hunks[0].old_start == 0);
    }

    SUBCASE("udiff_deletion") {
        auto patches = parse_directives(
            "--- a/old.txt\n"
            "+++ /dev/null\n"
            "@@ -1 +0,0 @@\n"
            "-gone\n");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0] == Patch::Delete("old.txt"));
    }

    SUBCASE("udiff_rename") {
        auto patches = parse_directives(
            "--- before.txt\n"
            "+++ after.txt\n"
            "@@ -1 +1 @@\n"
            "-a\n"
            "+b\n");
        REQUIRE(patches.size() == 2);
        REQUIRE(patches[0] == Patch::Move("before.txt", "after.txt"));
        REQUIRE(patches[1].is_udiff());
        REQUIRE(patches[1].file_path == "after.txt");
    }

    SUBCASE("udiff_several_files") {
        auto patches = parse_directives(
            "diff --git a/one.txt b/one.txt\n"
            "index 83db48f..bf269f4 100644\n"
            "--- a/one.txt\n"
            "+++ b/one.txt\n"
            "@@ -1 +1 @@\n"
            "-1\n"
            "+one\n"
            "diff --git a/two.txt b/two.txt\n"
            "--- a/two.txt\n"
            "+++ b/two.txt\n"
            "@@ -3,1 +3,1 @@\n"
            "-2\n"
            "+two\n");
        REQUIRE(patches.size() == 2);
        REQUIRE(patches[0].file_path == "one.txt");
        REQUIRE(patches[1].file_path == "two.txt");
        REQUIRE(patches[1].as_udiff().hunks[0].old_start == 3);
    }

    SUBCASE("udiff_binary") {
        auto patches = parse_directives(
            "--- a/logo.png\n"
            "+++ b/logo.png\n"
            "Binary files a/logo.png and b/logo.png differ\n"
            "kept.txt <<<<<<< DELETE\n");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0] == Patch::Delete("kept.txt"));
    }

    SUBCASE("udiff_followed_by_command") {
        auto patches = parse_directives(
            "--- a.txt\n"
            "+++ a.txt\n"
            "@@ -1 +1 @@\n"
            "-x\n"
            "+y\n"
            "b.txt <<<<<<< DELETE\n");
        REQUIRE(patches.size() == 2);
        REQUIRE(patches[0].is_udiff());
        REQUIRE(patches[1] == Patch::Delete("b.txt"));
    }

    SUBCASE("block_after_udiff_targets_the_diffed_file") {
        auto patches = parse_directives(
            "--- a.txt\n"
            "+++ a.txt\n"
            "@@ -1 +1 @@\n"
            "-1\n"
            "+one\n"
            "<<<<<<< SEARCH\n"
            "3\n"
            "=======\n"
            "three\n"
            ">>>>>>> REPLACE\n");
        REQUIRE(patches.size() == 2);
        REQUIRE(patches[0].is_udiff());
        REQUIRE(patches[1] == Patch::Modify("a.txt", "3\n", "three\n"));
    }

    SUBCASE("block_after_rename_targets_the_new_name") {
        auto patches = parse_directives(
            "--- a/old.txt\n"
            "+++ b/new.txt\n"
            "<<<<<<< SEARCH\n"
            "x\n"
            "=======\n"
            "y\n"
            ">>>>>>> REPLACE\n");
        REQUIRE(patches.size() == 2);
        REQUIRE(patches[0] == Patch::Move("old.txt", "new.txt"));
        REQUIRE(patches[1] == Patch::Modify("new.txt", "x\n", "y\n"));
    }

    SUBCASE("block_after_udiff_deletion_has_no_path") {
        auto patches = parse_directives(
            "--- gone.txt\n"
            "+++ /dev/null\n"
            "<<<<<<< SEARCH\n"
            "x\n"
            "=======\n"
            "y\n"
            ">>>>>>> REPLACE\n");
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0] == Patch::Delete("gone.txt"));
    }

    SUBCASE("mixed_formats") {
        auto patches = parse_directives(
            "--- file1.py\n"
            "+++ file1.py\n"
            "@@ -1,1 +1,2 @@\n"
            " print(\"hello\")\n"
            "+print(\"world\")\n"
            "\n"
            "file2.rs\n"
            "<<<<<<< SEARCH\n"
            "old code\n"
            "=======\n"
            "new code\n"
            ">>>>>>> REPLACE\n"
            "\n"
            "file3.txt <<<<<<< DELETE\n");
        REQUIRE(patches.size() == 3);
        REQUIRE(patches[0].is_udiff());
        REQUIRE(patches[0].file_path == "file1.py");
        REQUIRE(patches[1].is_modify());
        REQUIRE(patches[1].file_path == "file2.rs");
        REQUIRE(patches[2].is_delete());
        REQUIRE(patches[2].file_path == "file3.txt");
    }

    SUBCASE("incremental_feed") {
        ParserState state;
        std::vector<Patch> emitted;
        parser_feed(state, "a.txt\n", emitted);
        parser_feed(state, "<<<<<<< SEARCH\n", emitted);
        REQUIRE(state.mode == ParserMode::InSearch);
        parser_feed(state, "x\n", emitted);
        parser_feed(state, "=======\n", emitted);
        REQUIRE(state.mode == ParserMode::InReplace);
        parser_feed(state, "y\n", emitted);
        REQUIRE(emitted.empty());
        parser_feed(state, ">>>>>>> REPLACE\n", emitted);
        REQUIRE(state.mode == ParserMode::Idle);
        REQUIRE(emitted.size() == 1);
        parser_finish(state, emitted);
        REQUIRE(emitted.size() == 1);
    }
}
