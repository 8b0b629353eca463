#include "operations/memory_file_system.hpp"
#include "operations/preflight.hpp"

#include <doctest.h>

#include <vector>

using namespace mender;

namespace {
Hunk
hello_hunk() {
    Hunk hunk;
    hunk.old_start = 1;
    hunk.old_len = 2;
    hunk.new_start = 1;
    hunk.new_len = 3;
    hunk.lines = {
        HunkLine::Context("def hello():\n"),
        HunkLine::Add("    print('Hello')\n"),
        HunkLine::Context("    pass\n"),
    };
    return hunk;
}

bool
contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}
}  // namespace

TEST_CASE("preflight") {
    MemoryFileSystem fs;
    fs.add_file("test.py", "def hello():\n    pass");

    SUBCASE("modify") {
        std::vector<Patch> patches = {Patch::Modify("test.py", "def hello():\n    pass", "def world()")};
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(result.is_ok());
        REQUIRE(result.reports.size() == 1);
        REQUIRE(result.reports[0] == "  - Patch #1 for 'test.py': OK");
    }

    SUBCASE("modify_missing_file") {
        std::vector<Patch> patches = {Patch::Modify("nonexistent.py", "def hello()", "def world()")};
        auto result = run_preflight_checks(patches, fs);
        REQUIRE_FALSE(result.is_ok());
        REQUIRE(result.errors[0] == "  - Patch #1 for 'nonexistent.py': FAILED (File not found)");
    }

    SUBCASE("modify_not_found_and_ambiguous") {
        fs.add_file("dup.txt", "x\ny\nx\n");
        std::vector<Patch> patches = {
            Patch::Modify("test.py", "nothing like this", "z"),
            Patch::Modify("dup.txt", "x", "z"),
        };
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(result.errors.size() == 2);
        REQUIRE(contains(result.errors[0], "Patch #1"));
        REQUIRE(contains(result.errors[0], "FAILED (Search block not found)"));
        REQUIRE(contains(result.errors[1], "Patch #2"));
        REQUIRE(contains(result.errors[1], "FAILED (Search block is ambiguous, found 2 times)"));
    }

    SUBCASE("creation_always_passes") {
        std::vector<Patch> patches = {
            Patch::Modify("new.txt", "", "content"),
            Patch::Modify("test.py", "  \n", "overwrite"),
        };
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(result.is_ok());
        REQUIRE(contains(result.reports[0], "OK (New file creation)"));
        REQUIRE(contains(result.reports[1], "OK (File will be overwritten)"));
    }

    SUBCASE("move") {
        fs.add_file("taken.py", "");
        std::vector<Patch> patches = {
            Patch::Move("test.py", "new.py"),
            Patch::Move("missing.py", "other.py"),
            Patch::Move("test.py", "taken.py"),
        };
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(contains(result.reports[0], "OK (Move to 'new.py')"));
        REQUIRE(result.errors.size() == 2);
        REQUIRE(contains(result.errors[0], "FAILED (Source file not found)"));
        REQUIRE(contains(result.errors[1], "FAILED (Destination file 'taken.py' already exists)"));
    }

    SUBCASE("delete") {
        std::vector<Patch> patches = {Patch::Delete("test.py"), Patch::Delete("missing.py")};
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(contains(result.reports[0], "OK (File scheduled for deletion)"));
        REQUIRE(result.errors.size() == 1);
        REQUIRE(contains(result.errors[0], "FAILED (File not found, cannot delete)"));
    }

    SUBCASE("readonly_is_checked_first") {
        fs.add_file("locked.txt", "x\n", true);
        std::vector<Patch> patches = {Patch::Modify("locked.txt", "", "y"), Patch::Delete("locked.txt")};
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(result.errors.size() == 2);
        REQUIRE(contains(result.errors[0], "FAILED (File is read-only)"));
        REQUIRE(contains(result.errors[1], "FAILED (File is read-only)"));
    }

    SUBCASE("udiff") {
        std::vector<Patch> patches = {Patch::Udiff("test.py", {hello_hunk()})};
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(result.is_ok());
    }

    SUBCASE("udiff_missing_file") {
        Hunk hunk;
        hunk.old_start = 1;
        hunk.old_len = 1;
        hunk.new_start = 1;
        hunk.new_len = 1;
        hunk.lines = {HunkLine::Context("test\n")};

        std::vector<Patch> patches = {Patch::Udiff("nonexistent.py", {hunk})};
        auto result = run_preflight_checks(patches, fs);
        REQUIRE_FALSE(result.is_ok());
        REQUIRE(contains(result.errors[0], "File not found"));
    }

    SUBCASE("udiff_creation") {
        Hunk hunk;
        hunk.new_start = 1;
        hunk.new_len = 1;
        hunk.lines = {HunkLine::Add("fresh\n")};

        std::vector<Patch> patches = {Patch::Udiff("fresh.txt", {hunk})};
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(result.is_ok());
        REQUIRE(contains(result.reports[0], "OK (New file creation via Udiff)"));
    }

    SUBCASE("udiff_creation_needing_context") {
        Hunk hunk;
        hunk.lines = {HunkLine::Context("existing\n"), HunkLine::Add("fresh\n")};

        std::vector<Patch> patches = {Patch::Udiff("fresh.txt", {hunk})};
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(contains(result.errors[0], "FAILED (Hunk #1 failed. Expected 1 match, found 0)"));
    }

    SUBCASE("udiff_empty_hunks") {
        std::vector<Patch> patches = {Patch::Udiff("test.py", {})};
        auto result = run_preflight_checks(patches, fs);
        REQUIRE_FALSE(result.is_ok());
        REQUIRE(contains(result.errors[0], "contains no hunks"));
    }

    SUBCASE("udiff_hunk_failure_stops_directive_not_batch") {
        Hunk bad;
        bad.old_start = 1;
        bad.lines = {HunkLine::Remove("not in file\n")};

        std::vector<Patch> patches = {
            Patch::Udiff("test.py", {bad, hello_hunk()}),
            Patch::Delete("test.py"),
        };
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(result.errors.size() == 1);
        REQUIRE(contains(result.errors[0], "Hunk #1 failed. Expected 1 match, found 0"));
        REQUIRE(result.reports.size() == 1);
        REQUIRE(contains(result.reports[0], "Patch #2"));
    }

    SUBCASE("nothing_is_written") {
        std::vector<Patch> patches = {
            Patch::Modify("test.py", "pass", "return"),
            Patch::Modify("new.txt", "", "x"),
            Patch::Delete("test.py"),
        };
        auto result = run_preflight_checks(patches, fs);
        REQUIRE(result.is_ok());
        REQUIRE(fs.write_count == 0);
        REQUIRE(fs.files.size() == 1);
    }
}
