#pragma once

/*
    Dry simulation of a whole batch of directives.

    Every directive is checked against the current state of the file system,
    nothing is modified. All directives are checked even after a failure so
    the complete list of problems can be shown at once; any failure blocks
    the batch.
*/

#include "operations/file_system.hpp"
#include "patch/patch.hpp"

#include <gsl/span>
#include <string>
#include <vector>

namespace mender {

struct PreflightResult {
    // One line per failing directive, in directive order.
    std::vector<std::string> errors;

    // One line per directive that passed.
    std::vector<std::string> reports;

    bool
    is_ok() const {
        return errors.empty();
    }
};

PreflightResult
run_preflight_checks(gsl::span<const Patch> patches, const FileSystem& fs);

}  // namespace mender
