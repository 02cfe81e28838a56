/*
  Logging Selftest

  Checks:
    1) Level names parse case-insensitively; unknown names leave the level alone.
    2) Messages below the current level are dropped.
    3) Line format: [timestamp][LEVEL] [component] message, WARN+ on stderr.
*/

#include "engine/core/logging.hpp"
#include "engine/core/selftest_support.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace skid;
using namespace skid::selftest;

namespace {

// Redirects a stream into a buffer for the lifetime of the object.
class Capture {
 public:
  explicit Capture(std::ostream& os) : os_(os), old_(os.rdbuf(buf_.rdbuf())) {}
  ~Capture() { os_.rdbuf(old_); }
  std::string str() const { return buf_.str(); }

 private:
  std::ostream& os_;
  std::ostringstream buf_;
  std::streambuf* old_;
};

void test_parse() {
  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("debug", &lvl) && lvl == LogLevel::DEBUG, "debug");
  expect_true(parse_log_level("WARN", &lvl) && lvl == LogLevel::WARN, "WARN (upper case)");
  expect_true(parse_log_level("warning", &lvl) && lvl == LogLevel::WARN, "warning alias");
  expect_true(parse_log_level("Error", &lvl) && lvl == LogLevel::ERROR, "Error (mixed case)");
  expect_true(!parse_log_level("warn ", &lvl) && !parse_log_level("", &lvl), "trailing space and empty rejected");
  expect_true(parse_log_level("Off", &lvl) && lvl == LogLevel::OFF, "Off");
  expect_true(!parse_log_level("verbose", &lvl) && lvl == LogLevel::OFF, "unknown name leaves level");
  expect_true(!parse_log_level("info", nullptr), "null out rejected");
}

void test_filter_and_format() {
  set_log_level(LogLevel::WARN);
  expect_true(get_log_level() == LogLevel::WARN, "level stored");

  std::string out_text;
  std::string err_text;
  {
    Capture out(std::cout);
    Capture err(std::cerr);
    log(LogLevel::INFO, "utility", "dropped");
    log(LogLevel::WARN, "utility", "oil amount exceeds catalog");
    log(LogLevel::ERROR, "plain message");
    out_text = out.str();
    err_text = err.str();
  }

  expect_true(out_text.empty(), "INFO dropped at WARN level");
  expect_true(err_text.find("[WARN] [utility] oil amount exceeds catalog\n") != std::string::npos,
              "WARN line carries level and component");
  expect_true(err_text.find("[ERROR] plain message\n") != std::string::npos, "component-less line");
  expect_true(err_text.rfind("[", 0) == 0 && err_text.find("Z][WARN]") != std::string::npos,
              "UTC timestamp prefix");

  set_log_level(LogLevel::DEBUG);
  {
    Capture out(std::cout);
    log(LogLevel::DEBUG, "main_engine", "visible");
    out_text = out.str();
  }
  expect_true(out_text.find("[DEBUG] [main_engine] visible") != std::string::npos, "DEBUG to stdout");

  {
    Capture out(std::cout);
    Capture err(std::cerr);
    log(LogLevel::OFF, "never a level of its own");
    out_text = out.str() + err.str();
  }
  expect_true(out_text.empty(), "OFF is not a message level");

  set_log_level(LogLevel::OFF);
  {
    Capture err(std::cerr);
    log(LogLevel::ERROR, "silenced");
    err_text = err.str();
  }
  expect_true(err_text.empty(), "OFF silences everything");
  set_log_level(LogLevel::INFO);
}

}  // namespace

int main() {
  test_parse();
  test_filter_and_format();
  return finish("logging");
}
