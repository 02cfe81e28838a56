/*
  Ceiling Lookup Table Selftest

  Checks:
    1) Ceiling semantics: exact breakpoint hits itself, in-between values go up.
    2) Lookup is monotone non-decreasing over the shipped oil-pump catalog.
    3) Overflow: clamp returns the last row flagged, throw raises kTableOverflow.
    4) Empty table yields no hit; malformed tables are refused at construction.
*/

#include "engine/plant/catalog.hpp"
#include "engine/plant/ceiling_table.hpp"
#include "engine/core/selftest_support.hpp"

#include <limits>
#include <vector>

using namespace skid;
using namespace skid::selftest;

namespace {

void test_ceiling_semantics() {
  const OilPumpTable& t = default_oil_pump_table();

  auto h = t.lookup(28.4);
  expect_true(h && h->value == 1.5 && h->key == 28.4 && !h->clamped, "exact breakpoint 28.4 -> 1.5");

  h = t.lookup(13.261012380948706);
  expect_true(h && h->value == 1.5 && h->key == 28.4, "below first breakpoint -> first row");

  h = t.lookup(-5.0);
  expect_true(h && h->value == 1.5, "negative query -> first row");

  h = t.lookup(60.0001);
  expect_true(h && h->key == 80.0 && h->value == 3.0, "60.0001 -> 80 row (3.0 kW)");

  h = t.lookup(398.62249411764697);
  expect_true(h && h->key == 401.0 && h->value == 15.0, "398.6 -> 401 row (15 kW)");
}

void test_monotone() {
  const OilPumpTable& t = default_oil_pump_table();
  double prev = -1.0;
  bool ok = true;
  for (double x = 0.0; x <= 1200.0; x += 0.5) {
    const auto h = t.lookup(x);
    if (!h || h->value < prev) {
      ok = false;
      break;
    }
    prev = h->value;
  }
  expect_true(ok, "oil pump lookup is monotone non-decreasing on [0,1200]");
}

void test_overflow() {
  const OilPumpTable& clamp = default_oil_pump_table();
  expect_true(clamp.policy() == OverflowPolicy::Clamp, "shipped catalog clamps");

  const auto at = clamp.lookup(1035.0);
  const auto above = clamp.lookup(5000.0);
  expect_true(at && !at->clamped && at->value == 30.0, "1035 is in range");
  expect_true(above && above->clamped && above->value == 30.0 && above->key == 1035.0,
              "5000 clamps to the largest pump");

  const OilPumpTable strict = clamp.with_policy(OverflowPolicy::Throw);
  expect_true(strict.size() == clamp.size(), "with_policy keeps rows");
  const auto strict_at = strict.lookup(1035.0);
  expect_true(strict_at && strict_at->value == 30.0, "throw policy still serves the last breakpoint");
  expect_error(ErrorCode::kTableOverflow, [&] { (void)strict.lookup(1035.5); },
               "throw policy rejects overflow");

  expect_error(ErrorCode::kInvalidInput,
               [&] { (void)clamp.lookup(std::numeric_limits<double>::quiet_NaN()); },
               "NaN query rejected");
}

void test_unit_frame_catalog() {
  const UnitFrameTable& t = default_unit_frame_table();
  auto h = t.lookup(0.0);
  expect_true(h && h->value.unit_mass_t == 14.0, "0 kW -> smallest frame");

  h = t.lookup(700.0);
  expect_true(h && h->key == 710.0 && h->value.dimensions_m[0] == 5.5 && h->value.unit_mass_t == 22.0,
              "700 kW -> 710 frame (5.5 m, 22 t)");

  h = t.lookup(9000.0);
  expect_true(h && h->clamped && h->value.dimensions_m[1] == 6.0 && h->value.unit_mass_t == 50.0,
              "9000 kW clamps to the 7000 frame");
}

void test_definition() {
  const OilPumpTable empty("empty_table", {});
  expect_true(empty.empty(), "empty table constructs");
  expect_true(!empty.lookup(10.0).has_value(), "empty table -> no hit");

  expect_error(ErrorCode::kTableDefinition,
               [] { OilPumpTable bad("bad", {{10.0, 1.0}, {5.0, 2.0}}); },
               "descending breakpoints rejected");
  expect_error(ErrorCode::kTableDefinition,
               [] { OilPumpTable bad("dup", {{10.0, 1.0}, {10.0, 2.0}}); },
               "duplicate breakpoints rejected");
  expect_error(ErrorCode::kTableDefinition,
               [] { OilPumpTable bad("", {{10.0, 1.0}}); },
               "unnamed table rejected");
  expect_error(ErrorCode::kTableDefinition,
               [] {
                 OilPumpTable bad("inf", {{1.0, 1.0}, {std::numeric_limits<double>::infinity(), 2.0}});
               },
               "non-finite breakpoint rejected");
}

}  // namespace

int main() {
  test_ceiling_semantics();
  test_monotone();
  test_overflow();
  test_unit_frame_catalog();
  test_definition();
  return finish("ceiling_table");
}
