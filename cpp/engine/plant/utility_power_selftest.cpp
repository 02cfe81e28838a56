/*
  Utility Stage Selftest

  Checks:
    1) Reference case: oil amount, cooling water and pump resolution.
    2) Self use equals the component breakdown and net = P_gen - self use.
    3) Oil amounts past the catalog clamp to the largest pump and set the flag;
       a throw-policy catalog refuses them instead.
    4) Empty catalog and bad upstream values are rejected.
*/

#include "engine/plant/catalog.hpp"
#include "engine/plant/main_engine.hpp"
#include "engine/plant/utility_power.hpp"
#include "engine/core/selftest_support.hpp"

#include <limits>

using namespace skid;
using namespace skid::selftest;

namespace {

UtilityResult run(double shaft_kW, const UtilityParams& up = UtilityParams::defaults()) {
  const MainEngineResult m = compute_main_engine(MainEngineParams::defaults(shaft_kW));
  return compute_utility(m, up);
}

void test_reference_case() {
  const UtilityResult u = run(66.53419);

  expect_near(u.lubrication_oil_amount, 13.261012380948706, 1e-9, "oil amount");
  expect_near(u.oil_cooler_circulation_water_t_h, 0.32205315782303995, 1e-12, "cooling water t/h");
  expect_near(u.oil_pump_power_kW, 1.5, 0.0, "smallest pump selected");
  expect_true(!u.oil_pump_clamped, "no clamp");

  // 1.5 + 0.75 + 1.0 + 0.5 + 2.0
  expect_near(u.utility_self_consumption_kW, 5.75, 1e-12, "self use");
  expect_near(u.total_power_generation_kW, 45.24399571361179, 1e-9, "P_gen carried forward");
  expect_near(u.net_power_output_kW, 45.24399571361179 - 5.75, 1e-9, "net power");
  expect_near(u.air_demand_Nm3_h, 4.0, 0.0, "air demand");
  expect_near(u.nitrogen_demand_Nm3_h, 40.0, 0.0, "nitrogen demand");
}

void test_breakdown() {
  for (double p : {66.53419, 150.0, 2000.0, 4500.0}) {
    const UtilityResult u = run(p);
    const std::string at = " at " + std::to_string(p);
    expect_near(u.utility_self_consumption_kW, u.components.total_kW(), 0.0, "self use = components" + at);
    expect_near(u.components.lubrication_heater_kW, 0.5 * u.oil_pump_power_kW, 0.0, "heater = 0.5 pump" + at);
    expect_near(u.net_power_output_kW, u.total_power_generation_kW - u.utility_self_consumption_kW, 0.0,
                "net = P_gen - self use" + at);
    expect_true(u.net_power_output_kW < u.total_power_generation_kW, "net < P_gen" + at);
  }

  const UtilityResult u = run(2000.0);
  expect_near(u.lubrication_oil_amount, 398.62249411764697, 1e-8, "2000 kW oil amount");
  expect_near(u.oil_pump_power_kW, 15.0, 0.0, "2000 kW -> 15 kW pump");
  expect_near(u.utility_self_consumption_kW, 26.0, 1e-12, "2000 kW self use");
}

void test_fixed_draws_configurable() {
  UtilityParams up = UtilityParams::defaults();
  up.cooling_loop_pump_kW = 0.0;
  up.circulation_pump_kW = 0.0;
  up.control_cabinet_kW = 0.0;
  up.oil_heater_share = 0.0;
  const UtilityResult u = run(66.53419, up);
  expect_near(u.utility_self_consumption_kW, 1.5, 0.0, "pump only");
}

void test_overflow() {
  const UtilityResult u = run(6000.0);
  expect_true(u.lubrication_oil_amount > 1035.0, "6000 kW exceeds oil catalog");
  expect_true(u.oil_pump_clamped, "clamp flagged");
  expect_near(u.oil_pump_power_kW, 30.0, 0.0, "largest pump used");

  const OilPumpTable strict = default_oil_pump_table().with_policy(OverflowPolicy::Throw);
  const MainEngineResult m = compute_main_engine(MainEngineParams::defaults(6000.0));
  expect_error(ErrorCode::kTableOverflow, [&] { compute_utility(m, UtilityParams::defaults(), strict); },
               "throw-policy catalog refuses overflow");
}

void test_rejects() {
  const MainEngineResult m = compute_main_engine(MainEngineParams::defaults(100.0));

  const OilPumpTable empty("empty_oil_pump", {});
  expect_error(ErrorCode::kTableDefinition, [&] { compute_utility(m, UtilityParams::defaults(), empty); },
               "empty oil pump catalog rejected");

  MainEngineResult bad = m;
  bad.main_output_power_kW = std::numeric_limits<double>::quiet_NaN();
  expect_error(ErrorCode::kInvalidInput, [&] { compute_utility(bad, UtilityParams::defaults()); },
               "NaN upstream rejected");

  UtilityParams up = UtilityParams::defaults();
  up.oil_temp_rise_K = 0.0;
  expect_error(ErrorCode::kInvalidInput, [&] { compute_utility(m, up); }, "zero temperature rise rejected");
}

}  // namespace

int main() {
  test_reference_case();
  test_breakdown();
  test_fixed_draws_configurable();
  test_overflow();
  test_rejects();
  return finish("utility_power");
}
