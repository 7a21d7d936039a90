#pragma once

#include <string>

namespace edge_log {

// Prefix for every line, e.g. "canny-edge-server".
void set_program_name(const std::string &name);

// One line to stderr: "<program>: <msg>". stdout stays reserved for
// protocol frames. Safe to call from handler threads.
void log_err(const std::string &msg);

} // namespace edge_log
