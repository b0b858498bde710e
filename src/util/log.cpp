#include "csvpipe/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace cp {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
std::mutex g_mu;

const char* level_name(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "?";
}
}

void set_log_level(LogLevel lvl) noexcept { g_level.store(static_cast<int>(lvl)); }

bool log_enabled(LogLevel lvl) noexcept {
  return lvl != LogLevel::Off && static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

void log_line(LogLevel lvl, std::string_view tag, std::string_view msg) {
  std::lock_guard<std::mutex> lk(g_mu);
  std::cerr << '[' << level_name(lvl) << "] " << tag << ": " << msg << '\n';
}

}
