/*
  Economic Stage Selftest

  Checks:
    1) Reference figures from a known net power with default parameters.
    2) Linearity: doubling net power doubles every output exactly.
    3) Zero operating hours zero every output.
    4) EconomicParams::make() refuses out-of-range records.
*/

#include "engine/plant/economics.hpp"
#include "engine/core/selftest_support.hpp"

#include <limits>

using namespace skid;
using namespace skid::selftest;

namespace {

UtilityResult with_net(double net_kW) {
  UtilityResult u;
  u.net_power_output_kW = net_kW;
  return u;
}

void test_reference() {
  const EconomicResult e = compute_economics(with_net(1000.0), EconomicParams::defaults());
  // 1000 kW * 8000 h = 8e6 kWh = 800 x 10^4 kWh
  expect_near(e.annual_power_generation, 800.0, 1e-12, "annual generation");
  expect_near(e.annual_power_income, 480.0, 1e-9, "income = gen * 0.6");
  expect_near(e.annual_coal_savings, 280.0, 1e-9, "coal = gen * 0.35");
  expect_near(e.annual_coal_cost_savings, 140000.0, 1e-6, "coal cost = coal * 500");
  expect_near(e.annual_co2_reduction, 768.0, 1e-9, "co2 = gen * 0.96");
}

void test_linearity() {
  const EconomicParams p = EconomicParams::defaults();
  const EconomicResult a = compute_economics(with_net(39.49399571361179), p);
  const EconomicResult b = compute_economics(with_net(2.0 * 39.49399571361179), p);

  expect_near(b.annual_power_generation, 2.0 * a.annual_power_generation, 0.0, "generation linear");
  expect_near(b.annual_power_income, 2.0 * a.annual_power_income, 0.0, "income linear");
  expect_near(b.annual_coal_savings, 2.0 * a.annual_coal_savings, 0.0, "coal linear");
  expect_near(b.annual_coal_cost_savings, 2.0 * a.annual_coal_cost_savings, 0.0, "coal cost linear");
  expect_near(b.annual_co2_reduction, 2.0 * a.annual_co2_reduction, 0.0, "co2 linear");

  const EconomicResult n = compute_economics(with_net(-39.49399571361179), p);
  expect_true(n.annual_power_income < 0.0, "negative net power gives negative income");
}

void test_zero_hours() {
  const EconomicParams p = EconomicParams::make(0.0, 0.6, 0.35, 500.0, 0.96);
  const EconomicResult e = compute_economics(with_net(1234.5), p);
  expect_near(e.annual_power_generation, 0.0, 0.0, "no hours, no generation");
  expect_near(e.annual_power_income, 0.0, 0.0, "no hours, no income");
  expect_near(e.annual_co2_reduction, 0.0, 0.0, "no hours, no co2");
}

void test_make_rejects() {
  expect_error(ErrorCode::kParameterRange, [] { (void)EconomicParams::make(8761.0, 0.6, 0.35, 500.0, 0.96); },
               "hours above 8760 rejected");
  expect_error(ErrorCode::kParameterRange, [] { (void)EconomicParams::make(-1.0, 0.6, 0.35, 500.0, 0.96); },
               "negative hours rejected");
  expect_error(ErrorCode::kParameterRange, [] { (void)EconomicParams::make(8000.0, -0.1, 0.35, 500.0, 0.96); },
               "negative price rejected");
  expect_error(ErrorCode::kParameterRange,
               [] {
                 (void)EconomicParams::make(8000.0, 0.6, std::numeric_limits<double>::quiet_NaN(), 500.0, 0.96);
               },
               "NaN coal coefficient rejected");

  const EconomicParams full = EconomicParams::make(8760.0, 0.0, 0.0, 0.0, 0.0);
  expect_near(full.annual_operating_hours, 8760.0, 0.0, "8760 h accepted");
}

void test_rejects_non_finite_net() {
  expect_error(ErrorCode::kInvalidInput,
               [] { compute_economics(with_net(std::numeric_limits<double>::infinity()), EconomicParams::defaults()); },
               "infinite net power rejected");
}

}  // namespace

int main() {
  test_reference();
  test_linearity();
  test_zero_hours();
  test_make_rejects();
  test_rejects_non_finite_net();
  return finish("economics");
}
