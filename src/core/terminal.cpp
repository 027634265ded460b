#include <svn_bridge/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace svn_bridge {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool IsStdoutTty() {
    return isatty(STDOUT_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

// forced: 1 = --color, 0 = --no-color, -1 = auto.
bool ResolveColor(int forced, bool is_tty) {
    if (forced == 0) return false;
    if (forced == 1) return true;
    if (NoColorEnvSet()) return false;
    return is_tty;
}

} // namespace svn_bridge
