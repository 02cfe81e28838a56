#pragma once
/*
================================================================================
Core: Error Type
FILE: cpp/engine/core/error.hpp

Every failure in the engine surfaces as skid::Error. The code tells the
caller which check refused the input; skid_cli maps it to an exit code.

  kInvalidInput     main power zero/non-finite, efficiency factor outside
                    (0,1], non-positive physical constant, bad sweep range,
                    NaN table query, missing table             -> exit 2
  kParameterRange   economic or report record out of range (hours outside
                    [0,8760], negative price/coefficient)      -> exit 2
  kTableDefinition  catalog not strictly increasing, unnamed, or empty
                    where a row is required (oil pump)         -> exit 3
  kTableOverflow    query above the last breakpoint of a throw-policy
                    catalog                                    -> exit 3
  kIoError          CLI output file or stdout not writable     -> exit 4
  kInternal         placeholder code of a sweep row that has
                    not failed; never thrown by the engine
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace skid {

enum class ErrorCode : int {
  kInvalidInput    = 1,
  kParameterRange  = 2,
  kTableDefinition = 3,
  kTableOverflow   = 4,
  kIoError         = 5,
  kInternal        = 6,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidInput:    return "InvalidInput";
    case ErrorCode::kParameterRange:  return "ParameterRange";
    case ErrorCode::kTableDefinition: return "TableDefinition";
    case ErrorCode::kTableOverflow:   return "TableOverflow";
    case ErrorCode::kIoError:         return "IoError";
    case ErrorCode::kInternal:        return "Internal";
    default:                          return "Unknown";
  }
}

// Uniform exception type for every stage, table and exporter.
// Carries code + file/line/function so a rejected input can be traced back
// to the check that refused it.
class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[skid::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                    std::string message,
                                    const char* file,
                                    int line,
                                    const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::move(message), file, line, function);
  }
}

}  // namespace skid

#define SKID_THROW(CODE, MSG) ::skid::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define SKID_ENSURE(EXPR, CODE, MSG) ::skid::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
