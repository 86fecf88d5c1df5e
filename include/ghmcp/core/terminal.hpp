#pragma once

namespace ghmcp {

/// Returns true if the given file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Colored logs only when stderr is a terminal and NO_COLOR is unset.
bool UseColorForStderr();

} // namespace ghmcp
