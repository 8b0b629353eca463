#include "patch_applicator.hpp"

#include "operations/hunk_sequence.hpp"
#include "patch/matcher.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>

using namespace mender;

namespace {

ApplyResult
io_failure(const std::string& error) {
    return ApplyResult::failure(PatchErrorKind::Io, fmt::format("    [ERROR] {}", error));
}

ApplyResult
write_whole_file(const Patch& patch, FileSystem& fs, const std::string& content, const std::string& message) {
    std::string error;
    if (!fs.create_parent_directories(patch.file_path, error)) {
        return io_failure(error);
    }
    if (!fs.write_file(patch.file_path, content, error)) {
        if (fs.is_readonly(patch.file_path)) {
            return ApplyResult::failure(PatchErrorKind::ReadOnly, fmt::format("    [ERROR] {}", error));
        }
        return io_failure(error);
    }
    return ApplyResult::success(message);
}

ApplyResult
apply_move(const Patch& patch, FileSystem& fs, bool dry_run) {
    const auto& destination = patch.as_move().destination;
    if (!fs.exists(patch.file_path)) {
        return ApplyResult::failure(PatchErrorKind::MissingTarget,
                                    fmt::format("    [ERROR] Source file '{}' not found.", patch.file_path.string()));
    }
    if (fs.exists(destination)) {
        return ApplyResult::failure(
            PatchErrorKind::DestinationExists,
            fmt::format("    [ERROR] Destination file '{}' already exists.", destination.string()));
    }

    if (dry_run) {
        return ApplyResult::success(fmt::format("    [DRY RUN] File would be moved to '{}'", destination.string()));
    }

    std::string error;
    if (!fs.create_parent_directories(destination, error) || !fs.rename(patch.file_path, destination, error)) {
        return io_failure(error);
    }
    return ApplyResult::success(fmt::format("    [SUCCESS] File moved to '{}'", destination.string()));
}

ApplyResult
apply_delete(const Patch& patch, FileSystem& fs, bool dry_run) {
    if (!fs.exists(patch.file_path)) {
        return ApplyResult::failure(PatchErrorKind::MissingTarget, "    [ERROR] File not found, cannot delete.");
    }

    if (dry_run) {
        return ApplyResult::success("    [DRY RUN] File would be deleted.");
    }

    std::string error;
    if (!fs.remove(patch.file_path, error)) {
        return io_failure(error);
    }
    return ApplyResult::success("    [SUCCESS] File deleted.");
}

ApplyResult
apply_modify(const Patch& patch, FileSystem& fs, bool dry_run) {
    const auto& modify = patch.as_modify();

    if (modify.is_creation()) {
        if (dry_run) {
            return ApplyResult::success("    [DRY RUN] File would be created/overwritten.");
        }
        return write_whole_file(patch, fs, modify.replace, "    [SUCCESS] File created/overwritten.");
    }

    if (!fs.exists(patch.file_path)) {
        return ApplyResult::failure(PatchErrorKind::MissingTarget, "    [ERROR] File not found.");
    }

    std::string content;
    std::string error;
    if (!fs.read_file(patch.file_path, content, error)) {
        return io_failure(error);
    }

    auto lines = parselines(content);
    auto match = find_occurrences(lines, modify.search);
    if (!match.is_unique()) {
        return ApplyResult::failure(
            PatchErrorKind::AmbiguousMatch,
            fmt::format("    [ERROR] Expected 1 replacement, but {} occurred. Aborting.", match.starts.size()));
    }

    if (dry_run) {
        return ApplyResult::success("    [DRY RUN] Patch would be applied successfully.");
    }

    splice_lines(lines, match.starts[0], match.length, modify.replace);
    return write_whole_file(patch, fs, joinlines(lines), "    [SUCCESS] Patch applied.");
}

ApplyResult
apply_udiff(const Patch& patch, FileSystem& fs, bool dry_run) {
    const auto& hunks = patch.as_udiff().hunks;
    if (hunks.empty()) {
        return ApplyResult::failure(PatchErrorKind::InvalidPatch, "    [ERROR] Udiff patch contains no hunks.");
    }

    std::string content;
    if (fs.exists(patch.file_path)) {
        std::string error;
        if (!fs.read_file(patch.file_path, content, error)) {
            return io_failure(error);
        }
    }

    std::string patched;
    HunkFailure failure;
    if (!apply_hunks(content, hunks, patched, failure)) {
        return ApplyResult::failure(
            PatchErrorKind::HunkFailed,
            fmt::format("    [ERROR] Hunk #{} failed. Expected 1 match for block, found {}.\nSearch block:\n---\n{}---",
                        failure.hunk_number, failure.match_count, failure.search));
    }

    if (dry_run) {
        return ApplyResult::success("    [DRY RUN] Udiff patch(es) would be applied.");
    }
    return write_whole_file(patch, fs, patched, "    [SUCCESS] Udiff patch(es) applied.");
}

}  // namespace

ApplyResult
mender::apply_patch(const Patch& patch, FileSystem& fs, bool dry_run) {
    MENDER_TRACE("apply: {}{}", describe(patch), dry_run ? " (dry run)" : "");

    switch (patch.kind()) {
        case PatchKind::Move:
            return apply_move(patch, fs, dry_run);
        case PatchKind::Delete:
            return apply_delete(patch, fs, dry_run);
        case PatchKind::Modify:
            return apply_modify(patch, fs, dry_run);
        case PatchKind::Udiff:
            return apply_udiff(patch, fs, dry_run);
    }
    return ApplyResult::failure(PatchErrorKind::InvalidPatch, "    [ERROR] Unknown patch operation.");
}

std::string
mender::repr(PatchErrorKind kind) {
    switch (kind) {
        case PatchErrorKind::None:
            return "None";
        case PatchErrorKind::AmbiguousMatch:
            return "AmbiguousMatch";
        case PatchErrorKind::MissingTarget:
            return "MissingTarget";
        case PatchErrorKind::DestinationExists:
            return "DestinationExists";
        case PatchErrorKind::ReadOnly:
            return "ReadOnly";
        case PatchErrorKind::HunkFailed:
            return "HunkFailed";
        case PatchErrorKind::InvalidPatch:
            return "InvalidPatch";
        case PatchErrorKind::Io:
            return "Io";
    }
    return "Unknown";
}
