#include <ghmcp/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace ghmcp {

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

bool NoColorEnvSet() {
    const char* val = std::getenv("NO_COLOR");
    return val != nullptr;
}

bool UseColorForStderr() {
    return !NoColorEnvSet() && IsTerminal(STDERR_FILENO);
}

} // namespace ghmcp
