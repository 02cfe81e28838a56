/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
Line format:
  [2026-10-19T08:15:02Z][WARN] [utility] oil amount 1195.87 exceeds ...

  - The whole line is formatted before the lock is taken; the lock only
    covers the single write, so sweep points logging from several threads
    never interleave inside a line.
  - Level names are shared by the tag writer and parse_log_level().
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace skid {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_write_mu;

struct LevelName {
  const char* name;
  const char* tag;
  LogLevel level;
};

// "warning" is accepted on input only.
constexpr LevelName kLevelNames[] = {
  {"debug",   "DEBUG", LogLevel::DEBUG},
  {"info",    "INFO",  LogLevel::INFO},
  {"warn",    "WARN",  LogLevel::WARN},
  {"warning", "WARN",  LogLevel::WARN},
  {"error",   "ERROR", LogLevel::ERROR},
  {"off",     "OFF",   LogLevel::OFF},
};

const char* tag_of(LogLevel lvl) noexcept {
  for (const LevelName& n : kLevelNames) {
    if (n.level == lvl) return n.tag;
  }
  return "INFO";
}

bool iequals(std::string_view a, const char* b) noexcept {
  std::size_t i = 0;
  for (; i < a.size(); ++i) {
    if (b[i] == '\0') return false;
    const int ca = std::tolower(static_cast<unsigned char>(a[i]));
    if (ca != static_cast<unsigned char>(b[i])) return false;
  }
  return b[i] == '\0';
}

std::string utc_timestamp() {
  const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string format_line(LogLevel lvl, std::string_view component, const std::string& msg) {
  std::string line;
  line.reserve(32 + component.size() + msg.size());
  line += '[';
  line += utc_timestamp();
  line += "][";
  line += tag_of(lvl);
  line += "] ";
  if (!component.empty()) {
    line += '[';
    line.append(component.data(), component.size());
    line += "] ";
  }
  line += msg;
  line += '\n';
  return line;
}

bool enabled(LogLevel lvl) noexcept {
  return lvl < LogLevel::OFF && static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

void emit(LogLevel lvl, std::string_view component, const std::string& msg) noexcept {
  if (!enabled(lvl)) return;
  try {
    const std::string line = format_line(lvl, component, msg);
    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    std::lock_guard<std::mutex> lk(g_write_mu);
    out.write(line.data(), static_cast<std::streamsize>(line.size()));
    out.flush();
  } catch (...) {
    // Logging never throws; a failed write is dropped.
  }
}

}  // namespace

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parse_log_level(std::string_view name, LogLevel* out) noexcept {
  if (!out) return false;
  for (const LevelName& n : kLevelNames) {
    if (iequals(name, n.name)) {
      *out = n.level;
      return true;
    }
  }
  return false;
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  emit(lvl, std::string_view{}, msg);
}

void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept {
  emit(lvl, component, msg);
}

}  // namespace skid
