#pragma once

/*
    One complete run: parse the text, root relative paths, preflight the
    whole batch and, only if that passed, apply every directive in order.

    Directives are applied independently. A failing directive does not undo
    the ones applied before it.
*/

#include "operations/file_system.hpp"
#include "operations/patch_applicator.hpp"
#include "operations/preflight.hpp"
#include "patch/patch.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

struct SessionOptions {
    bool dry_run = false;

    // Relative directive paths are resolved against this directory. Empty
    // means the current directory.
    std::filesystem::path root_directory;
};

enum class SessionStatus {
    Ok,
    EmptyInput,
    NoDirectives,
    PreflightFailed,
    ApplyFailed,
};

std::string
repr(SessionStatus status);

struct PatchOutcome {
    std::size_t number;  // 1-based, in parse order
    Patch patch;
    ApplyResult result;
};

struct SessionReport {
    SessionStatus status = SessionStatus::Ok;

    std::vector<Patch> patches;
    PreflightResult preflight;
    std::vector<PatchOutcome> outcomes;

    std::size_t applied = 0;
    std::size_t failed = 0;

    // Exit status for the command line tool.
    int
    exit_code() const {
        return (status == SessionStatus::Ok || status == SessionStatus::NoDirectives) ? 0 : 1;
    }
};

// Prefix every relative file path and move destination with `directory`.
void
root_patches(std::vector<Patch>& patches, const std::filesystem::path& directory);

SessionReport
run_patch_session(std::string_view text, FileSystem& fs, const SessionOptions& options);

}  // namespace mender
