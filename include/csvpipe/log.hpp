#pragma once
#include <ostream>
#include <sstream>
#include <string_view>

namespace cp {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_log_level(LogLevel lvl) noexcept;
bool log_enabled(LogLevel lvl) noexcept;

// Writes "[<level>] <tag>: <msg>\n" to stderr. Safe to call from any thread.
void log_line(LogLevel lvl, std::string_view tag, std::string_view msg);

// Runs `fmt(std::ostream&)` only when `lvl` passes the threshold.
template <class Fmt>
void log_at(LogLevel lvl, std::string_view tag, Fmt&& fmt) {
  if (!log_enabled(lvl)) return;
  std::ostringstream os;
  fmt(static_cast<std::ostream&>(os));
  log_line(lvl, tag, os.str());
}

}
