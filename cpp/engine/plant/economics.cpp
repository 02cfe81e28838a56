#include "engine/plant/economics.hpp"

#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"
#include "engine/core/units.hpp"

#include <sstream>

namespace skid {

EconomicResult compute_economics(const UtilityResult& utility_result,
                                 const EconomicParams& params) {
  require_finite(utility_result.net_power_output_kW, ErrorCode::kInvalidInput,
                 "economics: net_power_output_kW");

  EconomicResult r;
  r.annual_power_generation = utility_result.net_power_output_kW *
                              params.annual_operating_hours /
                              units::kWh_per_reporting_unit;
  r.annual_power_income = r.annual_power_generation * params.electricity_price;
  r.annual_coal_savings = r.annual_power_generation * params.standard_coal_coefficient;
  r.annual_coal_cost_savings = r.annual_coal_savings * params.standard_coal_price;
  r.annual_co2_reduction = r.annual_power_generation * params.co2_emission_factor;

  if (get_log_level() <= LogLevel::DEBUG) {
    std::ostringstream oss;
    oss << "E_year=" << r.annual_power_generation
        << ", income=" << r.annual_power_income
        << ", coal=" << r.annual_coal_savings
        << ", co2=" << r.annual_co2_reduction;
    log(LogLevel::DEBUG, "economics", oss.str());
  }
  return r;
}

}  // namespace skid
