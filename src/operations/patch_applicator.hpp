#pragma once

/*
    Carry out one directive.

    The target file is written at most once, at the very end, and only when
    every step of the directive succeeded. In dry-run mode the directive is
    resolved the same way but nothing is written.
*/

#include "operations/file_system.hpp"
#include "patch/patch.hpp"

#include <string>

namespace mender {

enum class PatchErrorKind {
    None,
    AmbiguousMatch,     // zero or several matches for a search block
    MissingTarget,      // the file an operation needs is not there
    DestinationExists,  // move target already exists
    ReadOnly,
    HunkFailed,         // one hunk of a diff could not be placed
    InvalidPatch,
    Io,
};

std::string
repr(PatchErrorKind kind);

struct ApplyResult {
    PatchErrorKind kind = PatchErrorKind::None;
    std::string message;

    bool
    is_ok() const {
        return kind == PatchErrorKind::None;
    }

    static ApplyResult
    success(std::string message) {
        return {PatchErrorKind::None, std::move(message)};
    }

    static ApplyResult
    failure(PatchErrorKind kind, std::string message) {
        return {kind, std::move(message)};
    }
};

ApplyResult
apply_patch(const Patch& patch, FileSystem& fs, bool dry_run);

}  // namespace mender
