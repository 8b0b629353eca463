#include "directive_parser.hpp"

#include "parser/command_parser.hpp"
#include "parser/udiff_parser.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"

using namespace mender;

namespace {

void
flush_udiff(ParserState& state, std::vector<Patch>& emitted) {
    auto patches = finalize_udiff_patch(state.udiff_old_path, state.udiff_new_path, std::move(state.hunks));
    for (auto& patch : patches) {
        MENDER_TRACE("parser: {}", describe(patch));

        // A search/replace block straight after the diff targets the file
        // the diff left behind.
        if (patch.is_move()) {
            state.file_path = patch.as_move().destination.string();
        } else if (patch.is_delete()) {
            state.file_path.clear();
        } else {
            state.file_path = patch.file_path.string();
        }
        emitted.push_back(std::move(patch));
    }
    state.hunks.clear();
    state.udiff_new_path.reset();
}

void
begin_udiff(ParserState& state, std::string_view line) {
    state.mode = ParserMode::InUdiff;
    state.udiff_old_path = parse_udiff_path(line, kUdiffOldFilePrefix);
    state.udiff_new_path.reset();
    state.hunks.clear();
    state.previous_line.clear();
}

void
step_idle(ParserState& state, std::string_view line, std::vector<Patch>& emitted) {
    const auto stripped = trim(line);

    if (stripped == kMarkerSearchStart) {
        auto candidate = trim(state.previous_line);
        if (!candidate.empty()) {
            state.file_path = std::string(candidate);
        }
        state.mode = ParserMode::InSearch;
        state.search.clear();
        state.replace.clear();
    } else if (starts_with(stripped, kUdiffOldFilePrefix)) {
        begin_udiff(state, line);
    } else if (auto command = parse_line_command(line); command) {
        MENDER_TRACE("parser: {}", describe(*command));
        emitted.push_back(std::move(*command));
        state.previous_line.clear();
    } else if (starts_with(stripped, kCodeFence)) {
        // Fences around a block do not separate it from its path line.
    } else if (stripped.empty()) {
        state.previous_line.clear();
    } else {
        state.previous_line = std::string(line);
    }
}

void
step_in_search(ParserState& state, std::string_view line) {
    if (trim(line) == kMarkerDivider) {
        state.mode = ParserMode::InReplace;
    } else {
        state.search += line;
    }
}

void
step_in_replace(ParserState& state, std::string_view line, std::vector<Patch>& emitted) {
    if (trim(line) != kMarkerReplaceEnd) {
        state.replace += line;
        return;
    }

    if (state.file_path.empty()) {
        log_warning(fmt::format("ignoring search/replace block without a file path ({} line(s))",
                                parselines(state.search).size()));
    } else {
        auto patch = Patch::Modify(state.file_path, state.search, state.replace);
        MENDER_TRACE("parser: {}", describe(patch));
        emitted.push_back(std::move(patch));
    }
    state.search.clear();
    state.replace.clear();
    state.mode = ParserMode::Idle;
    state.previous_line.clear();
}

// Returns true when the line ended the diff and must be handled again by
// the idle state.
bool
step_in_udiff(ParserState& state, std::string_view line, std::vector<Patch>& emitted) {
    const auto stripped = trim(line);

    if (starts_with(stripped, kUdiffOldFilePrefix)) {
        flush_udiff(state, emitted);
        begin_udiff(state, line);
        return false;
    }

    if (starts_with(stripped, kUdiffNewFilePrefix)) {
        state.udiff_new_path = parse_udiff_path(line, kUdiffNewFilePrefix);
        return false;
    }

    if (starts_with(stripped, kUdiffHunkHeaderPrefix)) {
        if (auto hunk = parse_udiff_hunk_header(stripped); hunk) {
            state.hunks.push_back(std::move(*hunk));
        }
        return false;
    }

    if (starts_with(stripped, "Binary files")) {
        flush_udiff(state, emitted);
        state.mode = ParserMode::Idle;
        state.previous_line.clear();
        return false;
    }

    if (!state.hunks.empty()) {
        bool ignored = false;
        if (auto hunk_line = parse_udiff_hunk_line(line, ignored); hunk_line) {
            state.hunks.back().lines.push_back(std::move(*hunk_line));
            return false;
        }
        if (ignored) {
            return false;
        }
    } else if (stripped.empty()) {
        return false;
    }

    flush_udiff(state, emitted);
    state.mode = ParserMode::Idle;
    return true;
}

}  // namespace

void
mender::parser_feed(ParserState& state, std::string_view line, std::vector<Patch>& emitted) {
    switch (state.mode) {
        case ParserMode::Idle: {
            step_idle(state, line, emitted);
        } break;
        case ParserMode::InSearch: {
            step_in_search(state, line);
        } break;
        case ParserMode::InReplace: {
            step_in_replace(state, line, emitted);
        } break;
        case ParserMode::InUdiff: {
            if (step_in_udiff(state, line, emitted)) {
                step_idle(state, line, emitted);
            }
        } break;
    }
}

void
mender::parser_finish(ParserState& state, std::vector<Patch>& emitted) {
    if (state.mode == ParserMode::InUdiff) {
        flush_udiff(state, emitted);
    } else if (state.mode != ParserMode::Idle) {
        MENDER_TRACE("parser: discarding unterminated block ({})", repr(state.mode));
    }
    state.mode = ParserMode::Idle;
}

std::vector<Patch>
mender::parse_directives(std::string_view text) {
    std::vector<Patch> patches;
    ParserState state;
    for (const auto& line : parselines(text)) {
        parser_feed(state, line, patches);
    }
    parser_finish(state, patches);
    return patches;
}

std::string
mender::repr(ParserMode mode) {
    switch (mode) {
        case ParserMode::Idle:
            return "Idle";
        case ParserMode::InSearch:
            return "InSearch";
        case ParserMode::InReplace:
            return "InReplace";
        case ParserMode::InUdiff:
            return "InUdiff";
    }
    return "Unknown";
}
