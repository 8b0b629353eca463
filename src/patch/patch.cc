#include "patch.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

using namespace mender;

bool
ModifyOp::is_creation() const {
    return is_blank(search);
}

Patch
Patch::Delete(const std::filesystem::path& path) {
    return Patch{path, DeleteOp{}};
}

Patch
Patch::Move(const std::filesystem::path& source, const std::filesystem::path& destination) {
    return Patch{source, MoveOp{destination}};
}

Patch
Patch::Modify(const std::filesystem::path& path, const std::string& search, const std::string& replace) {
    return Patch{path, ModifyOp{search, replace}};
}

Patch
Patch::Udiff(const std::filesystem::path& path, std::vector<Hunk> hunks) {
    return Patch{path, UdiffOp{std::move(hunks)}};
}

std::string
mender::repr(PatchKind kind) {
    switch (kind) {
        case PatchKind::Delete:
            return "Delete";
        case PatchKind::Move:
            return "Move";
        case PatchKind::Modify:
            return "Modify";
        case PatchKind::Udiff:
            return "Udiff";
    }
    return "Unknown";
}

std::string
mender::describe(const Patch& patch) {
    const std::string path = patch.file_path.string();
    switch (patch.kind()) {
        case PatchKind::Delete:
            return fmt::format("delete '{}'", path);
        case PatchKind::Move:
            return fmt::format("move '{}' -> '{}'", path, patch.as_move().destination.string());
        case PatchKind::Modify: {
            const auto& modify = patch.as_modify();
            if (modify.is_creation()) {
                return fmt::format("write '{}' ({} lines)", path, parselines(modify.replace).size());
            }
            return fmt::format("modify '{}' ({} search lines, {} replace lines)", path,
                               parselines(modify.search).size(), parselines(modify.replace).size());
        }
        case PatchKind::Udiff: {
            const auto& hunks = patch.as_udiff().hunks;
            return fmt::format("udiff '{}' ({} hunk{})", path, hunks.size(), hunks.size() == 1 ? "" : "s");
        }
    }
    return path;
}
