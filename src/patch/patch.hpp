#pragma once

/*
    Directive vocabulary.

    A Patch is one unit of work against one target path. Patches are produced
    by the directive parser and only read afterwards; the preflight checker
    and the applicator never modify them.
*/

#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace mender {

enum class HunkLineType {
    Context,
    Add,
    Remove,
};

// One line of a unified diff hunk. `text` keeps the line terminator but not
// the leading ' ', '+' or '-' marker.
struct HunkLine {
    HunkLineType type;
    std::string text;

    static HunkLine
    Context(const std::string& text) {
        return {HunkLineType::Context, text};
    }

    static HunkLine
    Add(const std::string& text) {
        return {HunkLineType::Add, text};
    }

    static HunkLine
    Remove(const std::string& text) {
        return {HunkLineType::Remove, text};
    }

    bool
    operator==(const HunkLine& other) const {
        return type == other.type && text == other.text;
    }
};

// Line numbers are 1-based, 0 means unknown. Only `old_start` is used when
// applying, as a hint to pick between equal matches; the other numbers are
// kept for diagnostics.
struct Hunk {
    int64_t old_start = 0;
    int64_t old_len = 0;
    int64_t new_start = 0;
    int64_t new_len = 0;

    std::vector<HunkLine> lines;

    bool
    operator==(const Hunk& other) const {
        return old_start == other.old_start && old_len == other.old_len &&
               new_start == other.new_start && new_len == other.new_len && lines == other.lines;
    }
};

struct DeleteOp {
    bool
    operator==(const DeleteOp&) const {
        return true;
    }
};

struct MoveOp {
    std::filesystem::path destination;

    bool
    operator==(const MoveOp& other) const {
        return destination == other.destination;
    }
};

// An empty or whitespace-only `search` creates or overwrites the target
// with `replace`.
struct ModifyOp {
    std::string search;
    std::string replace;

    bool
    is_creation() const;

    bool
    operator==(const ModifyOp& other) const {
        return search == other.search && replace == other.replace;
    }
};

// Hunks are applied in order, each one against the result of the previous.
struct UdiffOp {
    std::vector<Hunk> hunks;

    bool
    operator==(const UdiffOp& other) const {
        return hunks == other.hunks;
    }
};

using PatchOp = std::variant<DeleteOp, MoveOp, ModifyOp, UdiffOp>;

enum class PatchKind {
    Delete,
    Move,
    Modify,
    Udiff,
};

struct Patch {
    // The current path of the target, i.e. the source path of a move.
    std::filesystem::path file_path;
    PatchOp op;

    static Patch
    Delete(const std::filesystem::path& path);

    static Patch
    Move(const std::filesystem::path& source, const std::filesystem::path& destination);

    static Patch
    Modify(const std::filesystem::path& path, const std::string& search, const std::string& replace);

    static Patch
    Udiff(const std::filesystem::path& path, std::vector<Hunk> hunks);

    PatchKind
    kind() const {
        return static_cast<PatchKind>(op.index());
    }

    // clang-format off
    bool is_delete() const { return std::holds_alternative<DeleteOp>(op); }
    bool is_move() const { return std::holds_alternative<MoveOp>(op); }
    bool is_modify() const { return std::holds_alternative<ModifyOp>(op); }
    bool is_udiff() const { return std::holds_alternative<UdiffOp>(op); }

    const MoveOp& as_move() const { return std::get<MoveOp>(op); }
    const ModifyOp& as_modify() const { return std::get<ModifyOp>(op); }
    const UdiffOp& as_udiff() const { return std::get<UdiffOp>(op); }
    // clang-format on

    bool
    operator==(const Patch& other) const {
        return file_path == other.file_path && op == other.op;
    }
};

std::string
repr(PatchKind kind);

// One line summary, e.g. "move 'a.txt' -> 'b.txt'"
std::string
describe(const Patch& patch);

}  // namespace mender
