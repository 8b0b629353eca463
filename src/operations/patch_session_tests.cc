#include "operations/memory_file_system.hpp"
#include "operations/patch_session.hpp"

#include <doctest.h>

#include <string>

using namespace mender;

namespace {
const char* kMixedInput =
    "Some explanation first.\n"
    "\n"
    "--- a/hello.py\n"
    "+++ b/hello.py\n"
    "@@ -1,2 +1,3 @@\n"
    " def hello():\n"
    "+    print('Hello')\n"
    "     pass\n"
    "notes.txt\n"
    "```\n"
    "<<<<<<< SEARCH\n"
    "draft\n"
    "=======\n"
    "final\n"
    ">>>>>>> REPLACE\n"
    "```\n"
    "\n"
    "obsolete.txt <<<<<<< DELETE\n";
}  // namespace

TEST_CASE("patch_session") {
    MemoryFileSystem fs;
    fs.add_file("hello.py", "def hello():\n    pass\n");
    fs.add_file("notes.txt", "title\ndraft\n");
    fs.add_file("obsolete.txt", "old\n");

    SUBCASE("mixed") {
        auto report = run_patch_session(kMixedInput, fs, {});
        REQUIRE(report.status == SessionStatus::Ok);
        REQUIRE(report.exit_code() == 0);
        REQUIRE(report.patches.size() == 3);
        REQUIRE(report.outcomes.size() == 3);
        REQUIRE(report.applied == 3);
        REQUIRE(report.failed == 0);
        REQUIRE(report.outcomes[2].number == 3);

        REQUIRE(fs.files["hello.py"] == "def hello():\n    print('Hello')\n    pass\n");
        REQUIRE(fs.files["notes.txt"] == "title\nfinal\n");
        REQUIRE_FALSE(fs.exists("obsolete.txt"));
    }

    SUBCASE("dry_run") {
        SessionOptions options;
        options.dry_run = true;
        auto report = run_patch_session(kMixedInput, fs, options);
        REQUIRE(report.status == SessionStatus::Ok);
        REQUIRE(fs.write_count == 0);
        REQUIRE(fs.exists("obsolete.txt"));
        for (const auto& outcome : report.outcomes) {
            REQUIRE(outcome.result.message.find("[DRY RUN]") != std::string::npos);
        }
    }

    SUBCASE("preflight_failure_blocks_everything") {
        fs.files.erase("notes.txt");
        auto report = run_patch_session(kMixedInput, fs, {});
        REQUIRE(report.status == SessionStatus::PreflightFailed);
        REQUIRE(repr(report.status) == "PreflightFailed");
        REQUIRE(report.exit_code() == 1);
        REQUIRE(report.preflight.errors.size() == 1);
        REQUIRE(report.preflight.errors[0] == "  - Patch #2 for 'notes.txt': FAILED (File not found)");
        REQUIRE(report.outcomes.empty());
        REQUIRE(fs.write_count == 0);
    }

    SUBCASE("apply_failure_is_not_rolled_back") {
        // Both directives pass preflight on their own, but the first one
        // removes the text the second one is looking for.
        const char* input =
            "notes.txt\n"
            "<<<<<<< SEARCH\n"
            "draft\n"
            "=======\n"
            "final\n"
            ">>>>>>> REPLACE\n"
            "<<<<<<< SEARCH\n"
            "draft\n"
            "=======\n"
            "again\n"
            ">>>>>>> REPLACE\n";
        auto report = run_patch_session(input, fs, {});
        REQUIRE(report.status == SessionStatus::ApplyFailed);
        REQUIRE(repr(report.status) == "ApplyFailed");
        REQUIRE(report.applied == 1);
        REQUIRE(report.failed == 1);
        REQUIRE(report.outcomes[1].result.kind == PatchErrorKind::AmbiguousMatch);
        REQUIRE(fs.files["notes.txt"] == "title\nfinal\n");
    }

    SUBCASE("block_directly_after_udiff") {
        fs.add_file("a.txt", "1\n2\n3\n");
        auto report = run_patch_session(
            "--- a.txt\n"
            "+++ a.txt\n"
            "@@ -1 +1 @@\n"
            "-1\n"
            "+one\n"
            "<<<<<<< SEARCH\n"
            "3\n"
            "=======\n"
            "three\n"
            ">>>>>>> REPLACE\n",
            fs, {});
        REQUIRE(report.status == SessionStatus::Ok);
        REQUIRE(report.applied == 2);
        REQUIRE(fs.files["a.txt"] == "one\n2\nthree\n");
    }

    SUBCASE("empty_input") {
        auto report = run_patch_session("", fs, {});
        REQUIRE(report.status == SessionStatus::EmptyInput);
        REQUIRE(report.exit_code() == 1);
    }

    SUBCASE("no_directives") {
        auto report = run_patch_session("just some prose\nand nothing else\n", fs, {});
        REQUIRE(report.status == SessionStatus::NoDirectives);
        REQUIRE(report.exit_code() == 0);
    }

    SUBCASE("root_directory") {
        MemoryFileSystem rooted;
        rooted.add_file("work/notes.txt", "draft\n");
        rooted.add_file("work/a.txt", "a\n");

        SessionOptions options;
        options.root_directory = "work";
        auto report = run_patch_session(
            "notes.txt\n"
            "<<<<<<< SEARCH\n"
            "draft\n"
            "=======\n"
            "final\n"
            ">>>>>>> REPLACE\n"
            "a.txt <<<<<<< MOVE >>>>>>> b.txt\n",
            rooted, options);
        REQUIRE(report.status == SessionStatus::Ok);
        REQUIRE(rooted.files["work/notes.txt"] == "final\n");
        REQUIRE(rooted.exists("work/b.txt"));
        REQUIRE_FALSE(rooted.exists("b.txt"));
    }
}

TEST_CASE("root_patches") {
    std::vector<Patch> patches = {
        Patch::Move("a.txt", "sub/b.txt"),
        Patch::Delete("/abs/c.txt"),
    };

    SUBCASE("relative_paths_are_rooted") {
        root_patches(patches, "/work");
        REQUIRE(patches[0].file_path == "/work/a.txt");
        REQUIRE(patches[0].as_move().destination == "/work/sub/b.txt");
        REQUIRE(patches[1].file_path == "/abs/c.txt");
    }

    SUBCASE("empty_directory_is_a_no_op") {
        root_patches(patches, "");
        REQUIRE(patches[0].file_path == "a.txt");
    }
}
