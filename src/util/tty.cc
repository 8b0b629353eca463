#include "tty.hpp"

#include <cstdio>
#include <unistd.h>

bool
mender::tty_stdout_is_terminal() {
    // Piping to less or redirecting to a file disables colored output.
    return isatty(STDOUT_FILENO) != 0;
}

bool
mender::tty_stdin_is_terminal() {
    return isatty(STDIN_FILENO) != 0;
}
