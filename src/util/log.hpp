#pragma once

/*
    Console output helpers.

    Everything user facing goes through fmt. Trace output is compiled in but
    only printed when verbose logging has been switched on at runtime.
*/

#include <fmt/format.h>

#include <cstdio>
#include <string>

namespace mender {

void
log_set_verbose(bool verbose);

bool
log_is_verbose();

void
log_error(const std::string& message);

void
log_warning(const std::string& message);

}  // namespace mender

#define MENDER_TRACE(...)                                           \
    if (mender::log_is_verbose()) {                                 \
        fmt::print(stderr, "trace: {}\n", fmt::format(__VA_ARGS__)); \
    }
