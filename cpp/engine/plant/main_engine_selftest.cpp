/*
  Main-Engine Stage Selftest

  Checks:
    1) Reference case (66.53419 kW shaft) against the loss-chain formulas.
    2) Ordering: total < output < input for positive shaft power.
    3) Sign symmetry: negating the shaft power negates every figure exactly.
    4) Zero, non-finite and out-of-range factors are rejected.
*/

#include "engine/plant/main_engine.hpp"
#include "engine/core/selftest_support.hpp"

#include <limits>

using namespace skid;
using namespace skid::selftest;

namespace {

void test_reference_case() {
  const MainEngineResult r = compute_main_engine(MainEngineParams::defaults(66.53419));

  expect_near(r.input_power_kW, 66.53419, 0.0, "input power echoed");
  expect_near(r.main_output_power_kW, 62.62144735447999, 1e-9, "P_out = P * 0.98^3");
  expect_near(r.total_power_generation_kW, 45.24399571361179, 1e-9, "P_gen = P_out * 0.85 * 0.85");
  expect_near(r.main_loss_power_kW, 12.524289470895996, 1e-9, "P_loss = P * 0.2 * 0.98^3");

  // Worked figures quoted for this case (62.79 / 45.37) are within 0.2 kW.
  expect_near(r.main_output_power_kW, 62.79, 0.2, "P_out near quoted figure");
  expect_near(r.total_power_generation_kW, 45.37, 0.2, "P_gen near quoted figure");
}

void test_ordering() {
  for (double p : {1.0, 66.53419, 500.0, 2000.0, 12000.0}) {
    const MainEngineResult r = compute_main_engine(MainEngineParams::defaults(p));
    expect_true(r.total_power_generation_kW < r.main_output_power_kW &&
                    r.main_output_power_kW < r.input_power_kW,
                "P_gen < P_out < P at " + std::to_string(p));
    expect_true(r.main_loss_power_kW > 0.0 && r.main_loss_power_kW < r.main_output_power_kW,
                "0 < P_loss < P_out at " + std::to_string(p));
  }
}

void test_sign_symmetry() {
  const MainEngineResult a = compute_main_engine(MainEngineParams::defaults(812.25));
  const MainEngineResult b = compute_main_engine(MainEngineParams::defaults(-812.25));
  expect_near(b.main_output_power_kW, -a.main_output_power_kW, 0.0, "P_out odd in P");
  expect_near(b.total_power_generation_kW, -a.total_power_generation_kW, 0.0, "P_gen odd in P");
  expect_near(b.main_loss_power_kW, -a.main_loss_power_kW, 0.0, "P_loss odd in P");
}

void test_custom_factors() {
  MainEngineParams p = MainEngineParams::defaults(100.0);
  p.cooling_loss_factor = 1.0;
  p.frequency_loss_factor = 1.0;
  p.wheel_resistance_factor = 1.0;
  p.wheel_loss_factor = 0.5;
  p.generator_efficiency = 0.5;
  const MainEngineResult r = compute_main_engine(p);
  expect_near(r.main_output_power_kW, 100.0, 0.0, "lossless chain passes power through");
  expect_near(r.total_power_generation_kW, 25.0, 0.0, "0.5 * 0.5 generator chain");
  expect_near(r.main_loss_power_kW, 20.0, 1e-12, "loss = P * (1 - 0.8)");
}

void test_rejects() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  expect_error(ErrorCode::kInvalidInput, [] { compute_main_engine(MainEngineParams::defaults(0.0)); },
               "zero shaft power rejected");
  expect_error(ErrorCode::kInvalidInput, [&] { compute_main_engine(MainEngineParams::defaults(nan)); },
               "NaN shaft power rejected");
  expect_error(ErrorCode::kInvalidInput, [&] { compute_main_engine(MainEngineParams::defaults(inf)); },
               "infinite shaft power rejected");

  expect_error(ErrorCode::kInvalidInput,
               [] {
                 MainEngineParams p = MainEngineParams::defaults(10.0);
                 p.generator_efficiency = 0.0;
                 compute_main_engine(p);
               },
               "zero generator efficiency rejected");
  expect_error(ErrorCode::kInvalidInput,
               [] {
                 MainEngineParams p = MainEngineParams::defaults(10.0);
                 p.main_loss_factor = 1.2;
                 compute_main_engine(p);
               },
               "factor above 1 rejected");
}

}  // namespace

int main() {
  test_reference_case();
  test_ordering();
  test_sign_symmetry();
  test_custom_factors();
  test_rejects();
  return finish("main_engine");
}
