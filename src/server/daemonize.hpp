#pragma once

#include <string>

namespace platform {

// Detaches from the terminal: double fork, new session, stdin from /dev/null.
// stdout and stderr are appended to `log_path` (or dropped when it is empty or
// cannot be opened). Returns false in the calling process if the first fork
// fails; otherwise returns true in the detached grandchild only.
bool daemonize(const std::string& log_path);

} // namespace platform
