#include "engine/plant/utility_power.hpp"

#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"
#include "engine/core/units.hpp"

#include <sstream>

namespace skid {

namespace {

// Loss heat is over-sized by 20% before the circuits are dimensioned.
constexpr double kLossHeatSafetyFactor = 1.2;

void validate_upstream(const MainEngineResult& m) {
  require_finite(m.main_output_power_kW, ErrorCode::kInvalidInput, "utility: main_output_power_kW");
  require_finite(m.total_power_generation_kW, ErrorCode::kInvalidInput, "utility: total_power_generation_kW");
}

}  // namespace

UtilityResult compute_utility(const MainEngineResult& main_result,
                              const UtilityParams& params,
                              const OilPumpTable& pump_table) {
  validate_upstream(main_result);
  params.validate_or_throw();

  UtilityResult r;

  const double loss_heat_kW =
      kLossHeatSafetyFactor * main_result.main_output_power_kW * params.mechanical_loss_ratio;

  r.lubrication_oil_amount =
      loss_heat_kW /
      (params.oil_density_kg_m3 * params.oil_heat_capacity * params.oil_temp_rise_K) *
      units::s_per_min * units::L_per_m3;

  r.oil_cooler_circulation_water_t_h =
      loss_heat_kW / params.cooling_water_cp / params.oil_temp_rise_K * units::kg_s_to_t_h;

  const auto hit = pump_table.lookup(r.lubrication_oil_amount);
  SKID_ENSURE(hit.has_value(), ErrorCode::kTableDefinition,
              "utility: oil pump table '" + pump_table.name() + "' is empty");
  r.oil_pump_power_kW = hit->value;
  r.oil_pump_clamped = hit->clamped;

  if (hit->clamped) {
    std::ostringstream oss;
    oss << "oil amount " << r.lubrication_oil_amount << " exceeds catalog maximum "
        << hit->key << "; using largest pump (" << hit->value << " kW)";
    log(LogLevel::WARN, "utility", oss.str());
  }

  r.components.lubrication_pump_kW = r.oil_pump_power_kW;
  r.components.lubrication_heater_kW = params.oil_heater_share * r.oil_pump_power_kW;
  r.components.cooling_loop_pump_kW = params.cooling_loop_pump_kW;
  r.components.circulation_pump_kW = params.circulation_pump_kW;
  r.components.control_cabinet_kW = params.control_cabinet_kW;

  r.utility_self_consumption_kW = r.components.total_kW();

  r.total_power_generation_kW = main_result.total_power_generation_kW;
  r.net_power_output_kW = r.total_power_generation_kW - r.utility_self_consumption_kW;

  r.air_demand_Nm3_h = params.air_demand_Nm3_h;
  r.nitrogen_demand_Nm3_h = params.nitrogen_demand_Nm3_h;

  if (get_log_level() <= LogLevel::DEBUG) {
    std::ostringstream oss;
    oss << "oil=" << r.lubrication_oil_amount
        << ", water=" << r.oil_cooler_circulation_water_t_h << " t/h"
        << ", pump=" << r.oil_pump_power_kW << " kW"
        << ", self_use=" << r.utility_self_consumption_kW << " kW"
        << ", P_net=" << r.net_power_output_kW << " kW";
    log(LogLevel::DEBUG, "utility", oss.str());
  }
  return r;
}

UtilityResult compute_utility(const MainEngineResult& main_result,
                              const UtilityParams& params) {
  return compute_utility(main_result, params, default_oil_pump_table());
}

}  // namespace skid
