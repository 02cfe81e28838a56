#include "engine/plant/selection_report.hpp"

#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace skid {

double payback_years(double investment_cost, double annual_income) {
  require_finite(investment_cost, ErrorCode::kInvalidInput, "payback: investment_cost");
  require_finite(annual_income, ErrorCode::kInvalidInput, "payback: annual_income");
  if (!(annual_income > 0.0)) return 0.0;
  return round_half_even(investment_cost / annual_income, 1);
}

static std::string model_name(const std::string& prefix, double installed_kW) {
  std::ostringstream oss;
  oss << prefix << static_cast<long long>(std::trunc(installed_kW));
  return oss.str();
}

SelectionReport build_selection_report(const CombinedResult& result,
                                       const PipelineSettings& settings,
                                       const PipelineTables& tables) {
  settings.report.validate_or_throw();
  SKID_ENSURE(tables.oil_pump != nullptr && tables.unit_frame != nullptr, ErrorCode::kInvalidInput,
              "selection_report: tables not set");

  SelectionReport rep;
  rep.net_power_kW = result.utility_power.net_power_output_kW;
  rep.annual_income = result.economic_analysis.annual_power_income;

  rep.installed_power_kW = result.unit_selection.unit_selection_kW;
  rep.unit_dimensions_m = result.unit_selection.unit_dimensions_m;
  rep.unit_weight_t = result.unit_selection.unit_weight_t;
  rep.module_weight_t = result.unit_selection.module_weight_t;

  const double threshold = settings.report.dual_stage_threshold_kW;
  if (rep.net_power_kW > threshold) {
    rep.layout.dual_stage = true;
    rep.layout.first_stage_kW = threshold;
    rep.layout.second_stage_kW = rep.net_power_kW - threshold;
    const double stage_power = std::max(rep.layout.second_stage_kW, threshold);

    // Re-size the frame for the larger stage.
    MainEngineParams stage_main = settings.main_engine;
    stage_main.main_power_kW = stage_power;
    const MainEngineResult m = compute_main_engine(stage_main);
    const UtilityResult u = compute_utility(m, settings.utility, *tables.oil_pump);
    const UnitSelectionResult s = compute_unit_selection(u, settings.unit, *tables.unit_frame);

    rep.installed_power_kW = stage_power;
    rep.unit_dimensions_m = s.unit_dimensions_m;
    rep.unit_weight_t = s.unit_weight_t;
    rep.module_weight_t = s.module_weight_t;

    std::ostringstream oss;
    oss << "dual-stage layout: " << rep.layout.first_stage_kW << " kW + "
        << rep.layout.second_stage_kW << " kW, sized at " << stage_power << " kW";
    log(LogLevel::INFO, "selection_report", oss.str());
  }

  rep.model = model_name(settings.report.model_prefix, rep.installed_power_kW);
  rep.investment_cost = std::trunc(rep.installed_power_kW) * settings.report.investment_per_kW;
  rep.payback_years = payback_years(rep.investment_cost, rep.annual_income);
  return rep;
}

}  // namespace skid
