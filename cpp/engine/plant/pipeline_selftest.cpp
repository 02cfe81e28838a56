/*
  Sizing Pipeline + Selection Report + Scenario Sweep Selftest

  Checks:
    1) The summary is wired from the stage results, not recomputed.
    2) Two runs with equal inputs are bit-identical.
    3) Selection report: model name, investment, payback, dual-stage split.
    4) Sweep records rejected points and keeps going.
    5) Hand-built out-of-range economic records are refused before any stage.
*/

#include "engine/plant/pipeline.hpp"
#include "engine/plant/scenario_sweep.hpp"
#include "engine/plant/selection_report.hpp"
#include "engine/core/selftest_support.hpp"

#include <cstring>
#include <limits>
#include <vector>

using namespace skid;
using namespace skid::selftest;

namespace {

bool same_bits(double a, double b) {
  return std::memcmp(&a, &b, sizeof(double)) == 0;
}

void test_summary_wiring() {
  const PipelineSettings s = PipelineSettings::defaults(150.0);
  const CombinedResult r = run_pipeline(s);

  expect_near(r.calculation_summary.input_main_power_kW, 150.0, 0.0, "summary input power");
  expect_near(r.calculation_summary.final_net_power_kW, r.utility_power.net_power_output_kW, 0.0,
              "summary net = utility net");
  expect_near(r.calculation_summary.annual_income, r.economic_analysis.annual_power_income, 0.0,
              "summary income = economics income");
  expect_near(r.calculation_summary.selected_unit_power_kW, r.unit_selection.unit_selection_kW, 0.0,
              "summary installed = unit selection");

  expect_near(r.utility_power.total_power_generation_kW, r.main_engine.total_power_generation_kW, 0.0,
              "P_gen carried into utility");
  expect_near(r.utility_power.net_power_output_kW, 96.251683, 1e-6, "150 kW net power");
  expect_near(r.economic_analysis.annual_power_income, 46.20080784, 1e-6, "150 kW income");
  expect_near(r.unit_selection.unit_selection_kW, 100.0, 0.0, "150 kW installed");
}

void test_overloads_agree() {
  const PipelineSettings s = PipelineSettings::defaults(812.0);
  const CombinedResult a = run_pipeline(s);
  const CombinedResult b = run_pipeline(s.main_engine, s.utility, s.economics, s.unit);
  const CombinedResult c = run_pipeline(s.main_engine, s.utility, s.economics, s.unit, PipelineTables::defaults());

  expect_true(same_bits(a.calculation_summary.final_net_power_kW, b.calculation_summary.final_net_power_kW) &&
                  same_bits(a.calculation_summary.final_net_power_kW, c.calculation_summary.final_net_power_kW),
              "overloads agree");
}

void test_determinism() {
  const PipelineSettings s = PipelineSettings::defaults(66.53419);
  const CombinedResult a = run_pipeline(s);
  const CombinedResult b = run_pipeline(s);

  expect_true(same_bits(a.main_engine.total_power_generation_kW, b.main_engine.total_power_generation_kW) &&
                  same_bits(a.utility_power.lubrication_oil_amount, b.utility_power.lubrication_oil_amount) &&
                  same_bits(a.utility_power.net_power_output_kW, b.utility_power.net_power_output_kW) &&
                  same_bits(a.economic_analysis.annual_co2_reduction, b.economic_analysis.annual_co2_reduction) &&
                  same_bits(a.unit_selection.unit_selection_kW, b.unit_selection.unit_selection_kW),
              "repeated runs are bit-identical");
}

void test_null_tables() {
  PipelineTables t = PipelineTables::defaults();
  t.unit_frame = nullptr;
  expect_error(ErrorCode::kInvalidInput, [&] { run_pipeline(PipelineSettings::defaults(100.0), t); },
               "missing unit frame table rejected");
}

void test_economic_range() {
  EconomicParams hours;
  hours.annual_operating_hours = 9000.0;
  expect_error(ErrorCode::kParameterRange,
               [&] {
                 (void)run_pipeline(MainEngineParams::defaults(150.0), UtilityParams::defaults(), hours,
                                    UnitSelectionParams::defaults());
               },
               "9000 h record refused by run_pipeline");

  EconomicParams price;
  price.electricity_price = -0.6;
  expect_error(ErrorCode::kParameterRange,
               [&] {
                 (void)run_pipeline(MainEngineParams::defaults(150.0), UtilityParams::defaults(), price,
                                    UnitSelectionParams::defaults(), PipelineTables::defaults());
               },
               "negative price refused by run_pipeline");

  PipelineSettings s = PipelineSettings::defaults(150.0);
  s.economics.annual_operating_hours = std::numeric_limits<double>::quiet_NaN();
  expect_error(ErrorCode::kParameterRange, [&] { (void)run_pipeline(s); }, "NaN hours refused");

  s = PipelineSettings::defaults(150.0);
  s.report.dual_stage_threshold_kW = 0.0;
  expect_error(ErrorCode::kParameterRange, [&] { (void)run_pipeline(s); }, "settings overload validates every record");

  SweepConfig cfg;
  cfg.from_kW = 100.0;
  cfg.to_kW = 200.0;
  cfg.step_kW = 100.0;
  PipelineSettings bad = PipelineSettings::defaults(1.0);
  bad.economics.standard_coal_price = -1.0;
  const std::vector<SweepRow> rows = run_scenario_sweep(cfg, bad);
  expect_true(rows.size() == 2 && !rows[0].ok && rows[0].code == ErrorCode::kParameterRange && !rows[1].ok,
              "sweep rows rejected for out-of-range economics");
}

void test_report_single_stage() {
  const PipelineSettings s = PipelineSettings::defaults(150.0);
  const CombinedResult r = run_pipeline(s);
  const SelectionReport rep = build_selection_report(r, s);

  expect_eq_str(rep.model, "TP100", "model name");
  expect_near(rep.installed_power_kW, 100.0, 0.0, "installed power");
  expect_near(rep.investment_cost, 100.0, 0.0, "investment = 100 kW * 1.0");
  expect_near(rep.payback_years, 2.2, 1e-12, "payback = 100 / 46.2 -> 2.2");
  expect_true(!rep.layout.dual_stage, "single stage");
  expect_near(rep.unit_weight_t, 15.0, 0.0, "frame mass from unit selection");

  const CombinedResult small = run_pipeline(PipelineSettings::defaults(66.53419));
  const SelectionReport small_rep = build_selection_report(small, PipelineSettings::defaults(66.53419));
  expect_eq_str(small_rep.model, "TP0", "sub-step skid rounds to 0 kW");
  expect_near(small_rep.payback_years, 0.0, 0.0, "zero investment, zero payback");
}

void test_report_dual_stage() {
  const PipelineSettings s = PipelineSettings::defaults(2000.0);
  const CombinedResult r = run_pipeline(s);
  const SelectionReport rep = build_selection_report(r, s);

  expect_near(r.utility_power.net_power_output_kW, 1334.02244, 1e-6, "2000 kW net power");
  expect_true(rep.layout.dual_stage, "net > 1000 kW splits the skid");
  expect_near(rep.layout.first_stage_kW, 1000.0, 0.0, "first stage = threshold");
  expect_near(rep.layout.second_stage_kW, 334.02244, 1e-6, "second stage = remainder");
  expect_near(rep.installed_power_kW, 1000.0, 0.0, "sized at the larger stage");
  expect_eq_str(rep.model, "TP1000", "dual-stage model name");

  // 1000 kW re-run: P_gen 680 kW -> 700 kW installed -> 710 kW frame
  expect_true(rep.unit_dimensions_m[0] == 5.5 && rep.unit_dimensions_m[1] == 3.0 &&
                  rep.unit_dimensions_m[2] == 2.5,
              "frame re-resolved for the stage");
  expect_near(rep.unit_weight_t, 22.0, 0.0, "stage frame mass");
  expect_near(rep.module_weight_t, 10.0, 0.0, "stage module mass");

  expect_near(rep.investment_cost, 1000.0, 0.0, "investment");
  expect_near(rep.payback_years, 1.6, 1e-12, "payback 1000 / 640.3 -> 1.6");
  expect_near(rep.annual_income, r.economic_analysis.annual_power_income, 0.0, "income from full skid");
}

void test_payback_rule() {
  expect_near(payback_years(100.0, 0.0), 0.0, 0.0, "no income, no payback");
  expect_near(payback_years(100.0, -5.0), 0.0, 0.0, "negative income, no payback");
  expect_near(payback_years(100.0, 40.0), 2.5, 1e-12, "100 / 40 = 2.5");
  expect_near(payback_years(100.0, 285.71428571428572), 0.3, 0.0, "100 / 285.714 = 0.35 (stored below) -> 0.3");

  const PipelineSettings s = PipelineSettings::defaults(-150.0);
  const SelectionReport rep = build_selection_report(run_pipeline(s), s);
  expect_near(rep.payback_years, 0.0, 0.0, "absorbing machinery, no payback");
}

void test_sweep() {
  SweepConfig cfg;
  cfg.from_kW = 0.0;
  cfg.to_kW = 300.0;
  cfg.step_kW = 100.0;
  expect_true(cfg.point_count() == 4, "0..300 step 100 -> 4 points");

  const std::vector<SweepRow> rows = run_scenario_sweep(cfg, PipelineSettings::defaults(1.0));
  expect_true(rows.size() == 4, "one row per point");
  expect_true(!rows[0].ok && rows[0].code == ErrorCode::kInvalidInput, "0 kW point rejected");
  expect_true(!rows[0].message.empty(), "rejection message kept");
  expect_true(rows[1].ok && rows[2].ok && rows[3].ok, "remaining points sized");
  expect_near(rows[3].main_power_kW, 300.0, 0.0, "last point reaches 'to'");

  const CombinedResult direct = run_pipeline(PipelineSettings::defaults(200.0));
  expect_true(same_bits(rows[2].result.utility_power.net_power_output_kW, direct.utility_power.net_power_output_kW),
              "sweep point equals a direct run");

  SweepConfig bad = cfg;
  bad.step_kW = 0.0;
  expect_error(ErrorCode::kInvalidInput, [&] { (void)run_scenario_sweep(bad, PipelineSettings::defaults(1.0)); },
               "zero step rejected");
  bad = cfg;
  bad.to_kW = -1.0;
  expect_error(ErrorCode::kInvalidInput, [&] { bad.validate(); }, "to < from rejected");
  bad = cfg;
  bad.step_kW = 1e-6;
  expect_error(ErrorCode::kInvalidInput, [&] { bad.validate(); }, "point cap enforced");
}

}  // namespace

int main() {
  test_summary_wiring();
  test_overloads_agree();
  test_determinism();
  test_null_tables();
  test_economic_range();
  test_report_single_stage();
  test_report_dual_stage();
  test_payback_rule();
  test_sweep();
  return finish("pipeline");
}
