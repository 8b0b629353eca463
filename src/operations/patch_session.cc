#include "patch_session.hpp"

#include "parser/directive_parser.hpp"
#include "util/log.hpp"

using namespace mender;

void
mender::root_patches(std::vector<Patch>& patches, const std::filesystem::path& directory) {
    if (directory.empty()) {
        return;
    }

    auto rooted = [&directory](const std::filesystem::path& path) {
        return path.is_relative() ? directory / path : path;
    };

    for (auto& patch : patches) {
        patch.file_path = rooted(patch.file_path);
        if (auto* move = std::get_if<MoveOp>(&patch.op); move) {
            move->destination = rooted(move->destination);
        }
    }
}

SessionReport
mender::run_patch_session(std::string_view text, FileSystem& fs, const SessionOptions& options) {
    SessionReport report;

    if (text.empty()) {
        report.status = SessionStatus::EmptyInput;
        return report;
    }

    report.patches = parse_directives(text);
    if (report.patches.empty()) {
        report.status = SessionStatus::NoDirectives;
        return report;
    }
    MENDER_TRACE("session: {} directive(s)", report.patches.size());

    // Paths must be final before preflight; preflight and apply have to see
    // the same targets.
    root_patches(report.patches, options.root_directory);

    report.preflight = run_preflight_checks(report.patches, fs);
    if (!report.preflight.is_ok()) {
        report.status = SessionStatus::PreflightFailed;
        MENDER_TRACE("session: {} ({} error(s))", repr(report.status), report.preflight.errors.size());
        return report;
    }

    std::size_t number = 0;
    for (const auto& patch : report.patches) {
        number++;
        auto result = apply_patch(patch, fs, options.dry_run);
        if (result.is_ok()) {
            report.applied++;
        } else {
            report.failed++;
            MENDER_TRACE("session: patch #{} failed ({})", number, repr(result.kind));
        }
        report.outcomes.push_back({number, patch, std::move(result)});
    }

    report.status = report.failed > 0 ? SessionStatus::ApplyFailed : SessionStatus::Ok;
    MENDER_TRACE("session: {} ({} applied, {} failed)", repr(report.status), report.applied, report.failed);
    return report;
}

std::string
mender::repr(SessionStatus status) {
    switch (status) {
        case SessionStatus::Ok:
            return "Ok";
        case SessionStatus::EmptyInput:
            return "EmptyInput";
        case SessionStatus::NoDirectives:
            return "NoDirectives";
        case SessionStatus::PreflightFailed:
            return "PreflightFailed";
        case SessionStatus::ApplyFailed:
            return "ApplyFailed";
    }
    return "Unknown";
}
