/*
  Unit-Selection Stage Selftest

  Checks:
    1) Installed-power rounding (54.5 kW -> 100 kW) and its half-even tie rule.
    2) Frame resolution from the unit catalog, including overflow clamp.
    3) Empty catalog falls back to the UnitSelectionParams defaults.
    4) Margin and step validation.
*/

#include "engine/plant/catalog.hpp"
#include "engine/plant/unit_selection.hpp"
#include "engine/core/selftest_support.hpp"

#include <cstring>
#include <limits>

using namespace skid;
using namespace skid::selftest;

namespace {

UtilityResult with_total(double total_kW) {
  UtilityResult u;
  u.total_power_generation_kW = total_kW;
  u.net_power_output_kW = total_kW;
  return u;
}

void test_installed_power() {
  const UnitSelectionParams p = UnitSelectionParams::defaults();
  expect_near(select_installed_power(54.5, p), 100.0, 0.0, "54.5 kW -> 100 kW");
  expect_near(select_installed_power(45.24399571361179, p), 0.0, 0.0, "45.24 kW -> 0 kW");
  expect_near(select_installed_power(1360.02244, p), 1500.0, 0.0, "1360 kW -> 1500 kW");
  expect_near(select_installed_power(-54.5, p), -100.0, 0.0, "sign carried through");

  // margin 1 makes total/step the exact rounding quotient
  UnitSelectionParams unit = p;
  unit.selection_margin = 1.0;
  expect_near(select_installed_power(250.0, unit), 200.0, 0.0, "2.5 steps -> 2 (even)");
  expect_near(select_installed_power(350.0, unit), 400.0, 0.0, "3.5 steps -> 4 (even)");
  expect_near(select_installed_power(150.0, unit), 200.0, 0.0, "1.5 steps -> 2 (even)");
  expect_near(select_installed_power(50.0, unit), 0.0, 0.0, "0.5 steps -> 0 (even)");

  unit.catalog_step_kW = 50.0;
  expect_near(select_installed_power(120.0, unit), 100.0, 0.0, "custom step");

  // no upper bound on the margin
  unit = p;
  unit.selection_margin = 4.0;
  expect_near(select_installed_power(100.0, unit), 400.0, 0.0, "large margin accepted");
}

void test_frame_lookup() {
  const UnitSelectionParams p = UnitSelectionParams::defaults();

  UnitSelectionResult s = compute_unit_selection(with_total(102.001683), p);
  expect_near(s.unit_selection_kW, 100.0, 0.0, "102 kW -> 100 kW installed");
  expect_near(s.lookup_power_kW, 100.0, 0.0, "lookup uses installed power");
  expect_true(s.frame_source == FrameSource::Catalog, "catalog frame");
  expect_true(s.unit_dimensions_m[0] == 3.0 && s.unit_dimensions_m[1] == 2.5 && s.unit_dimensions_m[2] == 2.5,
              "100 kW -> 3 x 2.5 x 2.5 m");
  expect_near(s.unit_weight_t, 15.0, 0.0, "100 kW -> 15 t");
  expect_near(s.module_weight_t, 5.0, 0.0, "100 kW -> 5 t module");

  s = compute_unit_selection(with_total(1360.02244), p);
  expect_true(s.unit_dimensions_m[0] == 7.5 && s.unit_weight_t == 29.0, "1500 kW -> 1600 frame");

  s = compute_unit_selection(with_total(8000.0), p);
  expect_true(s.frame_source == FrameSource::CatalogClamped, "8800 kW clamps");
  expect_true(s.unit_dimensions_m[1] == 6.0 && s.unit_weight_t == 50.0, "largest frame used");
  expect_true(std::strcmp(to_string(s.frame_source), "catalog_clamped") == 0, "frame source name");
}

void test_empty_catalog_defaults() {
  UnitSelectionParams p = UnitSelectionParams::defaults();
  p.default_dimensions_m = {4.0, 3.0, 2.8};
  p.default_mass_t = 21.0;

  const UnitFrameTable empty("empty_frames", {});
  const UnitSelectionResult s = compute_unit_selection(with_total(500.0), p, empty);
  expect_true(s.frame_source == FrameSource::Defaults, "empty catalog -> defaults");
  expect_true(s.unit_dimensions_m == p.default_dimensions_m, "default dimensions");
  expect_near(s.unit_weight_t, 21.0, 0.0, "default mass");
  expect_near(s.module_weight_t, 0.0, 0.0, "no module mass from defaults");
  expect_near(s.unit_selection_kW, 600.0, 0.0, "installed power still computed");
}

void test_rejects() {
  UnitSelectionParams p = UnitSelectionParams::defaults();
  p.selection_margin = 0.9;
  expect_error(ErrorCode::kInvalidInput, [&] { (void)select_installed_power(100.0, p); }, "margin < 1 rejected");

  p.selection_margin = std::numeric_limits<double>::infinity();
  expect_error(ErrorCode::kInvalidInput, [&] { (void)select_installed_power(100.0, p); }, "infinite margin rejected");

  p = UnitSelectionParams::defaults();
  p.catalog_step_kW = 0.0;
  expect_error(ErrorCode::kInvalidInput, [&] { (void)select_installed_power(100.0, p); }, "zero step rejected");

  expect_error(ErrorCode::kInvalidInput,
               [] {
                 (void)compute_unit_selection(with_total(std::numeric_limits<double>::quiet_NaN()),
                                              UnitSelectionParams::defaults());
               },
               "NaN total rejected");
}

}  // namespace

int main() {
  test_installed_power();
  test_frame_lookup();
  test_empty_catalog_defaults();
  test_rejects();
  return finish("unit_selection");
}
