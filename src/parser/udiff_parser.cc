#include "udiff_parser.hpp"

#include "util/log.hpp"
#include "util/readlines.hpp"

#include <cctype>
#include <charconv>
#include <limits>

using namespace mender;

namespace {

// Unsigned decimal, at most INT32_MAX.
bool
parse_int(std::string_view s, int64_t& value) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    int64_t parsed = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed);
    if (ec != std::errc() || end != s.data() + s.size() || parsed > std::numeric_limits<int32_t>::max()) {
        return false;
    }
    value = parsed;
    return true;
}

// "10,5" or "10". A missing count means one line.
bool
parse_range(std::string_view s, int64_t& start, int64_t& count) {
    auto comma = s.find(',');
    if (comma == std::string_view::npos) {
        if (!parse_int(s, start)) {
            return false;
        }
        count = 1;
        return true;
    }
    if (!parse_int(s.substr(0, comma), start)) {
        return false;
    }
    if (!parse_int(s.substr(comma + 1), count)) {
        count = 0;
    }
    return true;
}

std::vector<std::string_view>
split_whitespace(std::string_view s) {
    std::vector<std::string_view> parts;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_whitespace(s[i])) {
            i++;
        }
        std::size_t start = i;
        while (i < s.size() && !is_whitespace(s[i])) {
            i++;
        }
        if (i > start) {
            parts.push_back(s.substr(start, i - start));
        }
    }
    return parts;
}

std::string
strip_prefix(const std::string& path, std::string_view prefix) {
    if (starts_with(path, prefix)) {
        return path.substr(prefix.size());
    }
    return path;
}

}  // namespace

std::optional<Hunk>
mender::parse_udiff_hunk_header(std::string_view header) {
    header = trim(header);
    if (!starts_with(header, "@@")) {
        return std::nullopt;
    }

    Hunk hunk;
    bool have_old = false;
    bool have_new = false;
    for (auto part : split_whitespace(header)) {
        if (part.size() < 2) {
            continue;
        }
        if (!have_old && part[0] == '-') {
            have_old = parse_range(part.substr(1), hunk.old_start, hunk.old_len);
        } else if (!have_new && part[0] == '+') {
            have_new = parse_range(part.substr(1), hunk.new_start, hunk.new_len);
        }
    }

    if (!have_old) {
        hunk.old_start = 0;
        hunk.old_len = 0;
    }
    if (!have_new) {
        hunk.new_start = 0;
        hunk.new_len = 0;
    }
    return hunk;
}

std::string
mender::parse_udiff_path(std::string_view line, std::string_view prefix) {
    auto stripped = trim(line);
    if (starts_with(stripped, prefix)) {
        stripped = stripped.substr(prefix.size());
    }
    if (auto tab = stripped.find('\t'); tab != std::string_view::npos) {
        stripped = stripped.substr(0, tab);
    }
    return std::string(trim(stripped));
}

std::optional<HunkLine>
mender::parse_udiff_hunk_line(std::string_view line, bool& ignored) {
    ignored = false;

    // A bare marker or an empty line stands for an empty line.
    auto text = [&line]() {
        return line.size() <= 1 ? std::string("\n") : std::string(line.substr(1));
    };

    const auto stripped = trim(line);
    if (starts_with(line, "-")) {
        return HunkLine::Remove(text());
    } else if (starts_with(line, "+")) {
        return HunkLine::Add(text());
    } else if (starts_with(line, " ") || stripped.empty()) {
        return HunkLine::Context(text());
    } else if (starts_with(stripped, "\\")) {
        ignored = true;
    }
    return std::nullopt;
}

std::vector<Patch>
mender::finalize_udiff_patch(const std::string& old_path,
                             const std::optional<std::string>& new_path,
                             std::vector<Hunk> hunks) {
    std::string source = old_path;
    std::string target = new_path ? *new_path : old_path;

    // git style a/ and b/ prefixes
    if (new_path) {
        bool old_is_git = starts_with(source, "a/") || source == kUdiffNullPath;
        bool new_is_git = starts_with(target, "b/") || target == kUdiffNullPath;
        if (old_is_git && new_is_git) {
            source = strip_prefix(source, "a/");
            target = strip_prefix(target, "b/");
        }
    }

    const bool is_creation = source == kUdiffNullPath;
    const bool is_deletion = target == kUdiffNullPath;

    std::vector<Patch> patches;
    if (source.empty() || target.empty() || (is_creation && is_deletion)) {
        MENDER_TRACE("udiff: dropping file section '{}' -> '{}'", source, target);
        return patches;
    }

    if (is_creation) {
        patches.push_back(Patch::Udiff(target, std::move(hunks)));
    } else if (is_deletion) {
        patches.push_back(Patch::Delete(source));
    } else if (source != target) {
        patches.push_back(Patch::Move(source, target));
        if (!hunks.empty()) {
            patches.push_back(Patch::Udiff(target, std::move(hunks)));
        }
    } else if (!hunks.empty()) {
        patches.push_back(Patch::Udiff(target, std::move(hunks)));
    }
    return patches;
}
