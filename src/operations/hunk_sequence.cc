#include "hunk_sequence.hpp"

#include "patch/matcher.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"

#include <algorithm>
#include <limits>
#include <optional>

using namespace mender;

namespace {

// `line + offset`, saturated to [0, INT64_MAX].
int64_t
shifted_line(int64_t line, int64_t offset) {
    if (offset > 0 && line > std::numeric_limits<int64_t>::max() - offset) {
        return std::numeric_limits<int64_t>::max();
    }
    return std::max<int64_t>(0, line + offset);
}

}  // namespace

HunkBlocks
mender::hunk_blocks(const Hunk& hunk) {
    HunkBlocks blocks;
    for (const auto& line : hunk.lines) {
        switch (line.type) {
            case HunkLineType::Context: {
                blocks.search += line.text;
                blocks.replace += line.text;
            } break;
            case HunkLineType::Remove: {
                blocks.search += line.text;
            } break;
            case HunkLineType::Add: {
                blocks.replace += line.text;
            } break;
        }
    }
    return blocks;
}

std::size_t
mender::splice_lines(std::vector<std::string>& lines,
                     std::size_t start,
                     std::size_t length,
                     std::string_view replacement) {
    auto replacement_lines = parselines(replacement);
    auto first = lines.begin() + static_cast<std::ptrdiff_t>(start);
    auto last = first + static_cast<std::ptrdiff_t>(length);
    lines.erase(first, last);
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(start), replacement_lines.begin(),
                 replacement_lines.end());
    return replacement_lines.size();
}

bool
mender::apply_hunks(const std::string& content,
                    gsl::span<const Hunk> hunks,
                    std::string& result,
                    HunkFailure& failure) {
    std::string current = content;
    int64_t line_offset = 0;

    std::size_t hunk_number = 0;
    for (const auto& hunk : hunks) {
        hunk_number++;
        auto blocks = hunk_blocks(hunk);

        // Nothing to find in nothing: the hunk creates the file.
        if (blocks.search.empty() && current.empty()) {
            current = blocks.replace;
            continue;
        }

        std::optional<int64_t> hint;
        if (hunk.old_start > 0) {
            hint = shifted_line(hunk.old_start, line_offset);
        }

        auto lines = parselines(current);
        auto match = find_occurrences(lines, blocks.search, hint);
        if (!match.is_unique()) {
            failure.hunk_number = hunk_number;
            failure.match_count = match.starts.size();
            failure.search = std::move(blocks.search);
            return false;
        }

        MENDER_TRACE("hunk #{}: matched line {} ({} lines, {})", hunk_number, match.starts[0] + 1, match.length,
                     repr(match.tier));

        auto added = splice_lines(lines, match.starts[0], match.length, blocks.replace);
        line_offset += static_cast<int64_t>(added) - static_cast<int64_t>(match.length);
        current = joinlines(lines);
    }

    result = std::move(current);
    return true;
}
