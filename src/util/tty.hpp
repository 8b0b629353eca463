#pragma once

namespace mender {

bool
tty_stdout_is_terminal();

bool
tty_stdin_is_terminal();

}  // namespace mender
