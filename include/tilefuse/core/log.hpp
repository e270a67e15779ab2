#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace tilefuse::core::log {

/// Debug output is off unless enabled (CLI --debug).
inline std::atomic<bool> g_debug{false};

inline void set_debug(bool debug) noexcept { g_debug = debug; }

namespace detail {

inline std::mutex& sink_mutex() {
  static std::mutex m;
  return m;
}

inline void write(const char* tag, const std::string& msg) {
  std::lock_guard lock(sink_mutex());
  std::cerr << tag << ' ' << msg << '\n';
}

}  // namespace detail

inline void d(const std::string& msg) {
  if (g_debug) detail::write("[DBG]", msg);
}
inline void i(const std::string& msg) { detail::write("[INF]", msg); }
inline void w(const std::string& msg) { detail::write("[WRN]", msg); }
inline void e(const std::string& msg) { detail::write("[ERR]", msg); }

}  // namespace tilefuse::core::log
