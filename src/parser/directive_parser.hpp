#pragma once

/*
    Turn free-form patch text into a list of directives.

    The input may mix several formats, in any order, with prose and code
    fences in between:

        path/to/file.py
        <<<<<<< SEARCH
        old text
        =======
        new text
        >>>>>>> REPLACE

        --- path/to/file.py
        +++ path/to/file.py
        @@ -1,2 +1,3 @@
         context
        +added

        path/to/file.py <<<<<<< DELETE
        old/path <<<<<<< MOVE >>>>>>> new/path

    Parsing is a line driven state machine. All of its memory lives in a
    ParserState value, so the text can also be fed incrementally.
*/

#include "patch/patch.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

constexpr std::string_view kMarkerSearchStart = "<<<<<<< SEARCH";
constexpr std::string_view kMarkerDivider = "=======";
constexpr std::string_view kMarkerReplaceEnd = ">>>>>>> REPLACE";
constexpr std::string_view kCodeFence = "```";

enum class ParserMode {
    Idle,
    InSearch,
    InReplace,
    InUdiff,
};

struct ParserState {
    ParserMode mode = ParserMode::Idle;

    // Last non-blank, non-fence line seen while idle; the candidate target
    // path of a following search block.
    std::string previous_line;

    // Target of search/replace blocks. Kept across blocks so several blocks
    // in a row can share one path line.
    std::filesystem::path file_path;

    std::string search;
    std::string replace;

    std::string udiff_old_path;
    std::optional<std::string> udiff_new_path;
    std::vector<Hunk> hunks;
};

// Feed one line, including its terminator. Completed directives are
// appended to `emitted`.
void
parser_feed(ParserState& state, std::string_view line, std::vector<Patch>& emitted);

// End of input. A pending diff is flushed; an unterminated search/replace
// block is dropped.
void
parser_finish(ParserState& state, std::vector<Patch>& emitted);

std::vector<Patch>
parse_directives(std::string_view text);

std::string
repr(ParserMode mode);

}  // namespace mender
