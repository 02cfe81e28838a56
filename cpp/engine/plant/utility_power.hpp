#pragma once
/*
================================================================================
Plant: Utility (Auxiliary Power) Stage
FILE: cpp/engine/plant/utility_power.hpp

Purpose:
  - Size the lubrication and cooling circuits from the mechanical loss heat,
    resolve the oil pump from the catalog, and net the auxiliary draw off the
    generated power.

Model (base = 1.2 * P_out * mechanical_loss_ratio, kW of loss heat with
20% safety):
  - oil amount     = base / (rho_oil * cp_oil * dT) * 60 * 1000
  - cooling water  = base / cp_water / dT * 3.6                 (t/h)
  - pump kW        = ceiling lookup of oil amount in the pump catalog
  - self use       = pump + heater_share*pump + loop pump + circulation pump
                     + control cabinet
  - net power      = P_gen - self use

Overflow:
  - An oil amount above the largest catalog breakpoint resolves to the
    largest pump (clamp policy) and is reported via `oil_pump_clamped`.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/plant/catalog.hpp"
#include "engine/plant/main_engine.hpp"

namespace skid {

// Per-consumer breakdown of the auxiliary draw (kW).
struct UtilityComponents {
  double lubrication_pump_kW = 0.0;
  double lubrication_heater_kW = 0.0;
  double cooling_loop_pump_kW = 0.0;
  double circulation_pump_kW = 0.0;
  double control_cabinet_kW = 0.0;

  double total_kW() const {
    return lubrication_pump_kW + lubrication_heater_kW + cooling_loop_pump_kW +
           circulation_pump_kW + control_cabinet_kW;
  }
};

struct UtilityResult {
  double lubrication_oil_amount = 0.0;
  double oil_cooler_circulation_water_t_h = 0.0;
  double oil_pump_power_kW = 0.0;
  bool oil_pump_clamped = false;

  double utility_self_consumption_kW = 0.0;

  // Carried forward from the main-engine stage.
  double total_power_generation_kW = 0.0;
  double net_power_output_kW = 0.0;

  double air_demand_Nm3_h = 0.0;
  double nitrogen_demand_Nm3_h = 0.0;

  UtilityComponents components;
};

UtilityResult compute_utility(const MainEngineResult& main_result,
                              const UtilityParams& params,
                              const OilPumpTable& pump_table);

// Uses default_oil_pump_table().
UtilityResult compute_utility(const MainEngineResult& main_result,
                              const UtilityParams& params);

}  // namespace skid
