#pragma once

/*
    Building blocks for reading unified diffs:

        --- old/path
        +++ new/path
        @@ -old_start,old_len +new_start,new_len @@
         context
        -removed
        +added

    The line by line state handling lives in the directive parser; this file
    holds the pieces that understand the syntax.
*/

#include "patch/patch.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

constexpr std::string_view kUdiffOldFilePrefix = "--- ";
constexpr std::string_view kUdiffNewFilePrefix = "+++ ";
constexpr std::string_view kUdiffHunkHeaderPrefix = "@@ ";
constexpr std::string_view kUdiffNullPath = "/dev/null";

// Parse "@@ -10,5 +12,8 @@". Returns nullopt if the line is not a hunk
// header at all; unparsable numbers are left at 0.
std::optional<Hunk>
parse_udiff_hunk_header(std::string_view header);

// Extract the path of a "--- " or "+++ " line. A timestamp after a tab is
// dropped.
std::string
parse_udiff_path(std::string_view line, std::string_view prefix);

// Classify a line inside a hunk. Returns nullopt for lines that are not
// hunk content. `ignored` is set for "\ No newline at end of file".
std::optional<HunkLine>
parse_udiff_hunk_line(std::string_view line, bool& ignored);

// Turn one file section of a diff into directives:
//   /dev/null -> path     creates `path`
//   path -> /dev/null     deletes `path`
//   a -> b                moves a to b, then applies the hunks to b
//   a -> a                applies the hunks to a
std::vector<Patch>
finalize_udiff_patch(const std::string& old_path,
                     const std::optional<std::string>& new_path,
                     std::vector<Hunk> hunks);

}  // namespace mender
