#include "preflight.hpp"

#include "operations/hunk_sequence.hpp"
#include "patch/matcher.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace mender;

namespace {

// Outcome of checking one directive. `detail` is shown in parentheses
// after OK or FAILED.
struct Check {
    bool ok = true;
    std::string detail;

    static Check
    pass(std::string detail = {}) {
        return {true, std::move(detail)};
    }

    static Check
    fail(std::string detail) {
        return {false, std::move(detail)};
    }
};

Check
check_move(const Patch& patch, const FileSystem& fs) {
    const auto& destination = patch.as_move().destination;
    if (!fs.exists(patch.file_path)) {
        return Check::fail("Source file not found");
    }
    if (fs.exists(destination)) {
        return Check::fail(fmt::format("Destination file '{}' already exists", destination.string()));
    }
    return Check::pass(fmt::format("Move to '{}'", destination.string()));
}

Check
check_delete(const Patch& patch, const FileSystem& fs) {
    if (!fs.exists(patch.file_path)) {
        return Check::fail("File not found, cannot delete");
    }
    return Check::pass("File scheduled for deletion");
}

Check
check_modify(const Patch& patch, const FileSystem& fs) {
    const auto& modify = patch.as_modify();
    const bool exists = fs.exists(patch.file_path);

    if (modify.is_creation()) {
        return Check::pass(exists ? "File will be overwritten" : "New file creation");
    }

    if (!exists) {
        return Check::fail("File not found");
    }

    std::string content;
    std::string error;
    if (!fs.read_file(patch.file_path, content, error)) {
        return Check::fail(fmt::format("Could not read file: {}", error));
    }

    auto match = find_occurrences(parselines(content), modify.search);
    if (match.starts.empty()) {
        return Check::fail("Search block not found");
    }
    if (match.starts.size() > 1) {
        return Check::fail(fmt::format("Search block is ambiguous, found {} times", match.starts.size()));
    }
    return Check::pass();
}

Check
check_udiff(const Patch& patch, const FileSystem& fs) {
    const auto& hunks = patch.as_udiff().hunks;

    std::string content;
    std::string detail;
    if (!fs.exists(patch.file_path)) {
        // Only a diff against an empty file may create one.
        bool creates = std::any_of(hunks.begin(), hunks.end(), [](const Hunk& h) { return h.old_start == 0; });
        if (!creates) {
            return Check::fail("File not found");
        }
        detail = "New file creation via Udiff";
    } else {
        if (hunks.empty()) {
            return Check::fail("Udiff patch contains no hunks");
        }
        std::string error;
        if (!fs.read_file(patch.file_path, content, error)) {
            return Check::fail(fmt::format("Could not read file: {}", error));
        }
    }

    std::string simulated;
    HunkFailure failure;
    if (!apply_hunks(content, hunks, simulated, failure)) {
        return Check::fail(
            fmt::format("Hunk #{} failed. Expected 1 match, found {}", failure.hunk_number, failure.match_count));
    }
    return Check::pass(detail);
}

}  // namespace

PreflightResult
mender::run_preflight_checks(gsl::span<const Patch> patches, const FileSystem& fs) {
    PreflightResult result;

    std::size_t number = 0;
    for (const auto& patch : patches) {
        number++;
        auto prefix = fmt::format("  - Patch #{} for '{}':", number, patch.file_path.string());

        Check check;
        if (fs.exists(patch.file_path) && fs.is_readonly(patch.file_path)) {
            check = Check::fail("File is read-only");
        } else {
            switch (patch.kind()) {
                case PatchKind::Move: {
                    check = check_move(patch, fs);
                } break;
                case PatchKind::Delete: {
                    check = check_delete(patch, fs);
                } break;
                case PatchKind::Modify: {
                    check = check_modify(patch, fs);
                } break;
                case PatchKind::Udiff: {
                    check = check_udiff(patch, fs);
                } break;
            }
        }

        MENDER_TRACE("preflight: {} -> {}", describe(patch), check.ok ? "ok" : check.detail);

        if (check.ok) {
            result.reports.push_back(check.detail.empty() ? fmt::format("{} OK", prefix)
                                                          : fmt::format("{} OK ({})", prefix, check.detail));
        } else {
            result.errors.push_back(fmt::format("{} FAILED ({})", prefix, check.detail));
        }
    }

    return result;
}
