#pragma once

/*
    Locate a block of text inside a file, line by line.

    The search block is compared against every window of source lines of the
    same height. Comparison is tried in tiers, from strict to loose, and the
    first tier that produces at least one match wins:

        strict   trailing whitespace is ignored
        trimmed  like strict, but blank lines at the start and end of the
                 search block are dropped first
        loose    blank lines dropped, and all surrounding whitespace on each
                 line is ignored (indentation drift)

    Nothing here fails; callers decide what zero or multiple matches mean.
*/

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

enum class MatchTier {
    None,
    Strict,
    Trimmed,
    Loose,
};

struct MatchResult {
    // 0-based indices into the source lines where the block starts.
    std::vector<std::size_t> starts;

    // Number of source lines one match covers. Blank line trimming can make
    // this smaller than the line count of the search block.
    std::size_t length = 0;

    MatchTier tier = MatchTier::None;

    bool
    is_unique() const {
        return starts.size() == 1;
    }
};

// `source_lines` are physical lines with terminators (see `parselines`).
// `line_hint` is a 1-based line number; when several matches are found it
// picks the one starting closest to it.
MatchResult
find_occurrences(gsl::span<const std::string> source_lines,
                 std::string_view search_block,
                 std::optional<int64_t> line_hint = std::nullopt);

std::string
repr(MatchTier tier);

}  // namespace mender
