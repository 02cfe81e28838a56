#pragma once
/*
================================================================================
Plant: Economic Stage
FILE: cpp/engine/plant/economics.hpp

All outputs are linear in net power. Annual energy is reported in units of
10^4 kWh; money in the same 10^4 scale as the electricity price implies.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/plant/utility_power.hpp"

namespace skid {

struct EconomicResult {
  double annual_power_generation = 0.0;   // 10^4 kWh
  double annual_power_income = 0.0;       // 10^4 CNY
  double annual_coal_savings = 0.0;       // t standard coal
  double annual_coal_cost_savings = 0.0;
  double annual_co2_reduction = 0.0;      // t CO2
};

// `params` is expected to come from EconomicParams::make() or to have passed
// validate_or_throw() (run_pipeline checks it before the first stage).
EconomicResult compute_economics(const UtilityResult& utility_result,
                                 const EconomicParams& params);

}  // namespace skid
