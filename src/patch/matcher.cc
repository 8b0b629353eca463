#include "matcher.hpp"

#include "util/log.hpp"
#include "util/readlines.hpp"

#include <array>
#include <cstdlib>

using namespace mender;

namespace {

using Normalizer = std::string_view (*)(std::string_view);

struct TierStrategy {
    MatchTier tier;
    bool trim_blank_lines;
    Normalizer normalize;
};

// clang-format off
const std::array<TierStrategy, 3> kTiers {{
    { MatchTier::Strict,  false, &mender::right_trim },
    { MatchTier::Trimmed, true,  &mender::right_trim },
    { MatchTier::Loose,   true,  &mender::trim },
}};
// clang-format on

void
trim_blank_lines(std::vector<std::string_view>& lines) {
    std::size_t first = 0;
    while (first < lines.size() && is_blank(lines[first])) {
        first++;
    }
    std::size_t last = lines.size();
    while (last > first && is_blank(lines[last - 1])) {
        last--;
    }
    lines = std::vector<std::string_view>(lines.begin() + first, lines.begin() + last);
}

// Source lines are normalized during comparison; only the (usually short)
// search block is normalized up front.
std::vector<std::size_t>
find_sublist(gsl::span<const std::string> source_lines,
             const std::vector<std::string_view>& search_lines,
             Normalizer normalize) {
    std::vector<std::size_t> matches;
    const std::size_t n = source_lines.size();
    const std::size_t m = search_lines.size();
    if (m == 0 || m > n) {
        return matches;
    }

    for (std::size_t i = 0; i + m <= n; i++) {
        bool equal = true;
        for (std::size_t j = 0; j < m; j++) {
            if (normalize(source_lines[i + j]) != search_lines[j]) {
                equal = false;
                break;
            }
        }
        if (equal) {
            matches.push_back(i);
        }
    }
    return matches;
}

std::size_t
closest_to(const std::vector<std::size_t>& starts, int64_t hint) {
    const int64_t target = hint > 0 ? hint - 1 : 0;
    std::size_t best = starts.front();
    int64_t best_distance = std::llabs(static_cast<int64_t>(best) - target);
    for (auto start : starts) {
        int64_t distance = std::llabs(static_cast<int64_t>(start) - target);
        if (distance < best_distance) {
            best = start;
            best_distance = distance;
        }
    }
    return best;
}

}  // namespace

MatchResult
mender::find_occurrences(gsl::span<const std::string> source_lines,
                         std::string_view search_block,
                         std::optional<int64_t> line_hint) {
    MatchResult result;
    const auto block_lines = splitlines(search_block);

    for (const auto& strategy : kTiers) {
        std::vector<std::string_view> search_lines = block_lines;
        if (strategy.trim_blank_lines) {
            trim_blank_lines(search_lines);
        }
        if (search_lines.empty()) {
            continue;
        }
        for (auto& line : search_lines) {
            line = strategy.normalize(line);
        }

        auto starts = find_sublist(source_lines, search_lines, strategy.normalize);
        if (!starts.empty()) {
            result.starts = std::move(starts);
            result.length = search_lines.size();
            result.tier = strategy.tier;
            break;
        }
    }

    MENDER_TRACE("matcher: {} match(es) of {} line(s) at tier {}", result.starts.size(), result.length,
                 repr(result.tier));

    if (result.starts.size() > 1 && line_hint) {
        result.starts = {closest_to(result.starts, *line_hint)};
        MENDER_TRACE("matcher: hint {} selected line {}", *line_hint, result.starts.front() + 1);
    }

    return result;
}

std::string
mender::repr(MatchTier tier) {
    switch (tier) {
        case MatchTier::None:
            return "none";
        case MatchTier::Strict:
            return "strict";
        case MatchTier::Trimmed:
            return "trimmed";
        case MatchTier::Loose:
            return "loose";
    }
    return "unknown";
}
