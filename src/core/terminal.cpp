#include <cfs_bridge/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace cfs_bridge {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    const char* value = std::getenv("NO_COLOR");
    return value != nullptr && value[0] != '\0';
}

bool ResolveLogColor(std::optional<bool> requested, bool stderr_is_tty, bool no_color) {
    if (requested.has_value()) {
        return *requested;
    }
    return stderr_is_tty && !no_color;
}

} // namespace cfs_bridge
