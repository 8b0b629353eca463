#pragma once

#include "util/color.hpp"
#include "util/config_file/config_file.hpp"

#include <string>

namespace mender {

struct ProgramOptions {
    bool help = false;
    bool version = false;

    bool dry_run = false;
    bool verbose = false;
    bool color = true;
    bool summary = true;

    // Relative directive paths are resolved against this directory.
    std::string root_directory;

    // Read patch text from this file; stdin when empty.
    std::string patch_file;
};

struct OutputStyle {
    // clang-format off
    TermStyle success = TermStyle {
        TermColor::kGreen,
        TermColor::kNone,
        TermStyle::Attribute::Bold
    };

    TermStyle failure = TermStyle {
        TermColor::kRed,
        TermColor::kNone,
        TermStyle::Attribute::Bold
    };

    TermStyle dry_run = TermStyle {
        TermColor::kYellow,
        TermColor::kNone,
        TermStyle::Attribute::Bold
    };

    TermStyle header = TermStyle {
        TermColor::kCyan,
        TermColor::kNone,
        TermStyle::Attribute::None
    };
    // clang-format on
};

// $XDG_CONFIG_HOME/mender
std::string
config_get_directory();

// Load mender.conf from the config directory and apply it on top of the
// given defaults. A default file is written when none exists.
void
config_apply_options(ProgramOptions& program_options, OutputStyle& output_style);

// Apply an already parsed config tree. Settings missing from `config` are
// added to it with the current value from the option structs, so that the
// tree can be written back as a complete file.
void
config_apply_value(Value& config, ProgramOptions& program_options, OutputStyle& output_style);

}  // namespace mender
