#include "pgvec/core/log.hpp"

#include <iostream>
#include <mutex>
#include <string>

#include "pgvec/core/platform_utils.hpp"

namespace pgvec::core {

auto debug_enabled() noexcept -> bool {
  static const bool enabled = env_flag_enabled("PGVEC_CODEC_DEBUG");
  return enabled;
}

void debug_log(std::string_view subsystem, std::string_view message) {
  if (!debug_enabled()) return;
  static std::mutex mu;
  std::lock_guard<std::mutex> lock(mu);
  std::cerr << "[pgvec][" << subsystem << "] " << message << std::endl;
}

void debug_log_error(std::string_view subsystem, const error& e) {
  if (!debug_enabled()) return;
  std::string line;
  line += error_code_name(e.code);
  line += " (";
  line += e.component;
  line += "): ";
  line += e.message;
  debug_log(subsystem, line);
}

} // namespace pgvec::core
