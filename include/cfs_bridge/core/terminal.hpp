#pragma once

#include <optional>

namespace cfs_bridge {

/// True when stderr, where console logs go, is a terminal.
bool IsStderrTty();

/// True when NO_COLOR is present and not empty (https://no-color.org/).
bool NoColorEnvSet();

/// Colour decision for the console log sink. An explicit --color/--no-color
/// wins; otherwise colour needs a terminal and no NO_COLOR.
bool ResolveLogColor(std::optional<bool> requested, bool stderr_is_tty, bool no_color);

} // namespace cfs_bridge
