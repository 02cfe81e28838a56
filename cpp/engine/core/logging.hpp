#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by every stage, the exporters and
    the CLI.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation), so scenario sweeps can run
    pipelines on several threads.
  - WARN/ERROR go to stderr, DEBUG/INFO to stdout.
===========================================================
*/

#include <string>
#include <string_view>

namespace skid {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, OFF = 4 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Parse "debug" / "info" / "warn" / "error" / "off" (case-insensitive).
// Returns false and leaves *out untouched on an unknown name.
bool parse_log_level(std::string_view name, LogLevel* out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

// Same, prefixed with a component tag: "[utility] ...".
void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept;

} // namespace skid
