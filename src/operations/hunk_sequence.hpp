#pragma once

/*
    Text level editing shared by preflight and the applicator, so that a
    simulation that passes is exactly the edit that will later be written.
*/

#include "patch/patch.hpp"

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

// The text a hunk expects to find (context and removed lines) and the text
// it leaves behind (context and added lines).
struct HunkBlocks {
    std::string search;
    std::string replace;
};

HunkBlocks
hunk_blocks(const Hunk& hunk);

// Replace `length` lines starting at `start` with the lines of
// `replacement`. Returns the line count of `replacement`.
std::size_t
splice_lines(std::vector<std::string>& lines, std::size_t start, std::size_t length, std::string_view replacement);

struct HunkFailure {
    std::size_t hunk_number = 0;  // 1-based
    std::size_t match_count = 0;
    std::string search;
};

// Apply `hunks` one after another to `content`. Every hunk is matched
// against the result of the previous one, using its old start line,
// shifted by the lines added or removed so far, as a hint. On failure
// nothing is written to `result` and `failure` describes the first hunk
// that did not resolve to exactly one match.
bool
apply_hunks(const std::string& content, gsl::span<const Hunk> hunks, std::string& result, HunkFailure& failure);

}  // namespace mender
