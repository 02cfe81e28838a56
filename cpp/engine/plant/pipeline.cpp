#include "engine/plant/pipeline.hpp"

#include "engine/core/logging.hpp"

#include <sstream>

namespace skid {

CombinedResult run_pipeline(const MainEngineParams& main_params,
                            const UtilityParams& utility_params,
                            const EconomicParams& economic_params,
                            const UnitSelectionParams& unit_params,
                            const PipelineTables& tables) {
  SKID_ENSURE(tables.oil_pump != nullptr, ErrorCode::kInvalidInput, "run_pipeline: oil_pump table null");
  SKID_ENSURE(tables.unit_frame != nullptr, ErrorCode::kInvalidInput, "run_pipeline: unit_frame table null");

  // Economic records are range-checked here, before any stage runs; the
  // economic stage itself only sees records that passed.
  economic_params.validate_or_throw();

  CombinedResult out;
  out.main_engine = compute_main_engine(main_params);
  out.utility_power = compute_utility(out.main_engine, utility_params, *tables.oil_pump);
  out.economic_analysis = compute_economics(out.utility_power, economic_params);
  out.unit_selection = compute_unit_selection(out.utility_power, unit_params, *tables.unit_frame);

  out.calculation_summary.input_main_power_kW = main_params.main_power_kW;
  out.calculation_summary.final_net_power_kW = out.utility_power.net_power_output_kW;
  out.calculation_summary.annual_income = out.economic_analysis.annual_power_income;
  out.calculation_summary.selected_unit_power_kW = out.unit_selection.unit_selection_kW;

  std::ostringstream oss;
  oss << "P_shaft=" << out.calculation_summary.input_main_power_kW
      << " kW -> P_net=" << out.calculation_summary.final_net_power_kW
      << " kW, income=" << out.calculation_summary.annual_income
      << ", installed=" << out.calculation_summary.selected_unit_power_kW << " kW";
  log(LogLevel::INFO, "pipeline", oss.str());
  return out;
}

CombinedResult run_pipeline(const MainEngineParams& main_params,
                            const UtilityParams& utility_params,
                            const EconomicParams& economic_params,
                            const UnitSelectionParams& unit_params) {
  return run_pipeline(main_params, utility_params, economic_params, unit_params,
                      PipelineTables::defaults());
}

CombinedResult run_pipeline(const PipelineSettings& settings, const PipelineTables& tables) {
  settings.validate_or_throw();
  return run_pipeline(settings.main_engine, settings.utility, settings.economics, settings.unit, tables);
}

}  // namespace skid
