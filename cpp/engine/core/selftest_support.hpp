#pragma once
/*
================================================================================
Core: Selftest Support
FILE: cpp/engine/core/selftest_support.hpp

Purpose:
  - Shared pass/fail bookkeeping for the framework-free *_selftest executables.
  - Each selftest is a tiny standalone program; a non-zero exit code from
    finish() marks the CTest entry as failed.

Usage:
  int main() {
    skid::selftest::expect_true(cond, "what");
    return skid::selftest::finish("unit_selection");
  }
================================================================================
*/

#include "engine/core/error.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

namespace skid::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

// Absolute tolerance; tol = 0 demands bit-identical values.
inline void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr.precision(17);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

// Runs fn and checks it throws skid::Error with the given code.
template <typename Fn>
void expect_error(ErrorCode code, Fn&& fn, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  expected Error{" << to_string(code) << "}, nothing thrown\n";
  } catch (const Error& e) {
    if (e.code() != code) {
      fail(msg);
      std::cerr << "  expected " << to_string(code) << ", got " << to_string(e.code()) << "\n";
    } else {
      pass(msg);
    }
  }
}

inline int finish(std::string_view suite) {
  if (g_fail_count != 0) {
    std::cerr << "\n" << suite << " selftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\n" << suite << " selftest: all passed\n";
  return 0;
}

}  // namespace skid::selftest
