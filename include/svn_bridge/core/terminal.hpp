#pragma once

namespace svn_bridge {

/// True if stderr is a terminal (colored log output).
bool IsStderrTty();

/// True if stdout is a terminal (colored tables).
bool IsStdoutTty();

/// True if NO_COLOR is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve color for a stream: explicit flag wins, then NO_COLOR, then TTY.
bool ResolveColor(int forced, bool is_tty);

} // namespace svn_bridge
