#include "config/config.hpp"
#include "operations/file_system.hpp"
#include "operations/patch_session.hpp"
#include "util/color.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"
#include "util/tty.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

struct Printer {
    mender::OutputStyle style;
    bool color = false;

    // Color the status word of a report line. Preflight lines end their
    // "'path':" prefix with the word, so a path can not be mistaken for it.
    std::string
    highlight(const std::string& line) const {
        // clang-format off
        const std::vector<std::tuple<std::string_view, std::string_view, const mender::TermStyle*>> words = {
            { "[SUCCESS]", "[SUCCESS]", &style.success },
            { "[DRY RUN]", "[DRY RUN]", &style.dry_run },
            { "[ERROR]",   "[ERROR]",   &style.failure },
            { "': FAILED", "FAILED",    &style.failure },
            { "': OK",     "OK",        &style.success },
        };
        // clang-format on

        for (const auto& [needle, word, word_style] : words) {
            auto pos = line.find(needle);
            if (pos == std::string::npos) {
                continue;
            }
            pos += needle.size() - word.size();
            return line.substr(0, pos) + mender::colorize(*word_style, std::string(word), color) +
                   line.substr(pos + word.size());
        }
        return line;
    }

    void
    header(const std::string& text) const {
        fmt::print("{}\n", mender::colorize(style.header, text, color));
    }

    void
    line(const std::string& text) const {
        fmt::print("{}\n", highlight(text));
    }
};

void
print_report(const mender::SessionReport& report, const Printer& out, bool summary) {
    using mender::SessionStatus;

    out.header("--- Running Preflight Checks ---");
    for (const auto& line : report.preflight.reports) {
        out.line(line);
    }

    if (report.status == SessionStatus::PreflightFailed) {
        out.header("\n--- Preflight Checks Failed ---");
        for (const auto& line : report.preflight.errors) {
            out.line(line);
        }
        fmt::print("\nAborting. No files were modified.\n");
        return;
    }

    out.header("\n--- Preflight Checks Passed. Proceeding with patching. ---");
    for (const auto& outcome : report.outcomes) {
        out.header(fmt::format("--- Applying patch to: '{}'", outcome.patch.file_path.string()));
        out.line(outcome.result.message);
    }

    if (summary) {
        out.header("\n--- Summary ---");
        fmt::print("Total patches:        {}\n", report.patches.size());
        fmt::print("Successfully applied: {}\n", report.applied);
        fmt::print("Failed to apply:      {}\n", report.failed);
    }
}

}  // namespace

int
main(int argc, char* argv[]) {
    mender::ProgramOptions opts;
    Printer out;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] [PATCH_FILE]

Apply search/replace blocks, unified diffs and move/delete commands to the
files they name. The patch text is read from PATCH_FILE, or from stdin when
no file is given.

Every patch is checked before anything is modified; if any check fails no
file is touched.

Options:
    -n, --dry-run              check and describe the patches, but do not modify any file
    -d, --directory [dir]      resolve relative paths in the patches against this directory
    -v, --verbose              print trace output
        --no-color             do not color the output
        --no-summary           do not print the summary
    -h, --help                 show this help and exit
        --version              show program version and exit
)",
                                       argv[0]);

        help += "\n";
        help += "Config directory:\n    " + mender::config_get_directory() + "\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message;
        }
        puts(help.c_str());
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"dry-run", no_argument, 0, 'n'},
                                               {"directory", required_argument, 0, 'd'},
                                               {"verbose", no_argument, 0, 'v'},
                                               {"no-color", no_argument, 0, '1'},
                                               {"no-summary", no_argument, 0, '2'},
                                               {"version", no_argument, 0, '3'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hnd:v", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'h':
                    opts.help = true;
                    return true;
                case '3':
                    opts.version = true;
                    return true;
                case 'n':
                    opts.dry_run = true;
                    break;
                case 'd':
                    opts.root_directory = optarg;
                    break;
                case 'v':
                    opts.verbose = true;
                    break;
                case '1':
                    opts.color = false;
                    break;
                case '2':
                    opts.summary = false;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        int positional_count = in_argc - optind;
        if (positional_count > 1) {
            show_help("error: expected at most one patch file");
            return false;
        }
        if (positional_count == 1) {
            opts.patch_file = in_argv[optind];
        }
        return true;
    };

    // Load the global defaults before we override them with command line args
    mender::config_apply_options(opts, out.style);

    if (!parse_args(argc, argv)) {
        return 1;
    }

    if (opts.help) {
        show_help("");
        return 0;
    }

    if (opts.version) {
        fmt::print("version: {}\n", MENDER_VERSION);
        fmt::print("vcs hash: {}\n", MENDER_BUILD_HASH);
        return 0;
    }

    mender::log_set_verbose(opts.verbose);
    out.color = opts.color && mender::tty_stdout_is_terminal();

    std::string patch_text;
    std::string error;
    if (!opts.patch_file.empty()) {
        if (!mender::readfile(opts.patch_file, patch_text, error)) {
            mender::log_error(fmt::format("Patch file not found at '{}'", opts.patch_file));
            return 1;
        }
    } else {
        if (mender::tty_stdin_is_terminal()) {
            mender::log_error("No patch file specified and no data piped from stdin.");
            return 1;
        }
        if (!mender::readstdin(patch_text, error)) {
            mender::log_error(error);
            return 1;
        }
    }

    mender::SessionOptions session_options;
    session_options.dry_run = opts.dry_run;
    session_options.root_directory = opts.root_directory;

    mender::LocalFileSystem disk;
    auto report = mender::run_patch_session(patch_text, disk, session_options);

    switch (report.status) {
        case mender::SessionStatus::EmptyInput: {
            mender::log_error("Empty patch content.");
        } break;
        case mender::SessionStatus::NoDirectives: {
            fmt::print("No valid patch blocks or commands found in the input.\n");
        } break;
        case mender::SessionStatus::Ok:
        case mender::SessionStatus::PreflightFailed:
        case mender::SessionStatus::ApplyFailed: {
            print_report(report, out, opts.summary);
        } break;
    }

    return report.exit_code();
}
