#pragma once
/*
================================================================================
Plant: Selection Report
FILE: cpp/engine/plant/selection_report.hpp

Purpose:
  - Turn a pipeline result into the quotation-level summary a customer sees:
      * model designation ("TP" + installed kW)
      * enclosure + mass
      * investment and payback
      * single- or dual-stage layout

Dual-stage rule:
  - When net power exceeds the threshold (default 1000 kW) the skid is split:
      first stage  = threshold
      second stage = net - threshold
      installed    = max(second stage, threshold)
    and the frame is re-resolved by running main_engine -> utility ->
    unit_selection with `installed` as shaft power.

Payback:
  - investment = trunc(installed kW) * investment_per_kW           (10^4 CNY)
  - payback    = round_half_even(investment / annual income, 1)    (years)
                 or 0 when annual income <= 0
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/plant/pipeline.hpp"

#include <string>

namespace skid {

struct StageLayout {
  bool dual_stage = false;
  double first_stage_kW = 0.0;   // 0 for single-stage
  double second_stage_kW = 0.0;  // 0 for single-stage
};

struct SelectionReport {
  std::string model;
  double installed_power_kW = 0.0;
  Dimensions unit_dimensions_m = {0.0, 0.0, 0.0};
  double unit_weight_t = 0.0;
  double module_weight_t = 0.0;

  double net_power_kW = 0.0;
  double annual_income = 0.0;
  double investment_cost = 0.0;
  double payback_years = 0.0;

  StageLayout layout;
};

// Payback rule on its own.
double payback_years(double investment_cost, double annual_income);

SelectionReport build_selection_report(const CombinedResult& result,
                                       const PipelineSettings& settings,
                                       const PipelineTables& tables = PipelineTables::defaults());

}  // namespace skid
