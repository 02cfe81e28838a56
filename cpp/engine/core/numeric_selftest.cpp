/*
  Numeric Guards + Rounding Selftest

  Checks:
    1) round_half_even sends exact .5 ties to the even neighbour, both signs.
    2) Non-tie values round to nearest.
    3) Decimal-digit rounding used by the payback figure.
    4) require_* guards throw with the caller's error code.
*/

#include "engine/core/numeric.hpp"
#include "engine/core/selftest_support.hpp"

#include <limits>

using namespace skid;
using namespace skid::selftest;

namespace {

void test_ties() {
  expect_near(round_half_even(0.5), 0.0, 0.0, "0.5 -> 0");
  expect_near(round_half_even(1.5), 2.0, 0.0, "1.5 -> 2");
  expect_near(round_half_even(2.5), 2.0, 0.0, "2.5 -> 2");
  expect_near(round_half_even(3.5), 4.0, 0.0, "3.5 -> 4");
  expect_near(round_half_even(-0.5), 0.0, 0.0, "-0.5 -> 0");
  expect_near(round_half_even(-1.5), -2.0, 0.0, "-1.5 -> -2");
  expect_near(round_half_even(-2.5), -2.0, 0.0, "-2.5 -> -2");
}

void test_non_ties() {
  expect_near(round_half_even(0.5995), 1.0, 0.0, "0.5995 -> 1");
  expect_near(round_half_even(0.4977), 0.0, 0.0, "0.4977 -> 0");
  expect_near(round_half_even(2.51), 3.0, 0.0, "2.51 -> 3");
  expect_near(round_half_even(-2.51), -3.0, 0.0, "-2.51 -> -3");
  expect_near(round_half_even(7.0), 7.0, 0.0, "integers unchanged");

  const double inf = std::numeric_limits<double>::infinity();
  expect_true(std::isinf(round_half_even(inf)), "inf passes through");
  expect_true(std::isnan(round_half_even(std::numeric_limits<double>::quiet_NaN())), "nan passes through");
}

void test_digits() {
  expect_near(round_half_even(1.5616928702738564, 1), 1.6, 1e-12, "1.5617 -> 1.6");
  expect_near(round_half_even(2.164464317297531, 1), 2.2, 1e-12, "2.1645 -> 2.2");
  expect_near(round_half_even(12.04, 1), 12.0, 1e-12, "12.04 -> 12.0");

  // Decimal rounding acts on the stored binary value, not on x * 10^digits.
  expect_near(round_half_even(0.35, 1), 0.3, 0.0, "0.35 (stored below) -> 0.3");
  expect_near(round_half_even(0.15, 1), 0.1, 0.0, "0.15 (stored below) -> 0.1");
  expect_near(round_half_even(1.45, 1), 1.4, 0.0, "1.45 (stored below) -> 1.4");
  expect_near(round_half_even(2.675, 2), 2.67, 0.0, "2.675 (stored below) -> 2.67");
  expect_near(round_half_even(-0.35, 1), -0.3, 0.0, "-0.35 -> -0.3");
  expect_near(round_half_even(0.25, 1), 0.2, 0.0, "0.25 exact tie -> 0.2 (even)");
  expect_near(round_half_even(0.75, 1), 0.8, 0.0, "0.75 exact tie -> 0.8 (even)");
}

void test_guards() {
  const double nan = std::numeric_limits<double>::quiet_NaN();

  expect_error(ErrorCode::kInvalidInput, [&] { require_finite(nan, ErrorCode::kInvalidInput, "x"); },
               "require_finite rejects NaN");
  expect_error(ErrorCode::kParameterRange, [] { require_positive(0.0, ErrorCode::kParameterRange, "x"); },
               "require_positive rejects 0 with caller's code");
  expect_error(ErrorCode::kInvalidInput, [] { require_nonnegative(-1e-9, ErrorCode::kInvalidInput, "x"); },
               "require_nonnegative rejects negative");
  expect_error(ErrorCode::kInvalidInput, [] { require_fraction(1.01, ErrorCode::kInvalidInput, "x"); },
               "require_fraction rejects > 1");
  expect_error(ErrorCode::kInvalidInput, [] { require_fraction(0.0, ErrorCode::kInvalidInput, "x"); },
               "require_fraction rejects 0");

  bool ok = true;
  try {
    require_fraction(1.0, ErrorCode::kInvalidInput, "x");
    require_nonnegative(0.0, ErrorCode::kInvalidInput, "x");
  } catch (const Error&) {
    ok = false;
  }
  expect_true(ok, "boundary values accepted");

  try {
    require_positive(-3.0, ErrorCode::kParameterRange, "UtilityParams: oil_temp_rise_K");
    fail("message check: nothing thrown");
  } catch (const Error& e) {
    expect_eq_str(e.message(), "UtilityParams: oil_temp_rise_K must be > 0", "message names the field");
    expect_true(e.line() > 0 && !e.file().empty(), "error carries source location");
  }
}

}  // namespace

int main() {
  test_ties();
  test_non_ties();
  test_digits();
  test_guards();
  return finish("numeric");
}
