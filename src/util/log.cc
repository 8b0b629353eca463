#include "log.hpp"

namespace {
bool g_verbose = false;
}  // namespace

void
mender::log_set_verbose(bool verbose) {
    g_verbose = verbose;
}

bool
mender::log_is_verbose() {
    return g_verbose;
}

void
mender::log_error(const std::string& message) {
    fmt::print(stderr, "error: {}\n", message);
}

void
mender::log_warning(const std::string& message) {
    fmt::print(stderr, "warning: {}\n", message);
}
