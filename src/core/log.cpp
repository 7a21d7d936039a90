#include "core/log.hpp"

#include <iostream>
#include <mutex>

namespace edge_log {

static std::mutex g_log_mutex;
static std::string g_program_name = "canny-edge";

void set_program_name(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_program_name = name;
}

void log_err(const std::string &msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << g_program_name << ": " << msg << "\n";
}

} // namespace edge_log
