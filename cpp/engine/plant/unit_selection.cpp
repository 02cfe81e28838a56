#include "engine/plant/unit_selection.hpp"

#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"

#include <sstream>

namespace skid {

const char* to_string(FrameSource s) noexcept {
  switch (s) {
    case FrameSource::Catalog:        return "catalog";
    case FrameSource::CatalogClamped: return "catalog_clamped";
    case FrameSource::Defaults:       return "defaults";
    default:                          return "catalog";
  }
}

double select_installed_power(double total_power_generation_kW,
                              const UnitSelectionParams& params) {
  require_finite(total_power_generation_kW, ErrorCode::kInvalidInput,
                 "unit_selection: total_power_generation_kW");
  params.validate_or_throw();

  const double steps =
      round_half_even(total_power_generation_kW * params.selection_margin / params.catalog_step_kW);
  return steps * params.catalog_step_kW;
}

UnitSelectionResult compute_unit_selection(const UtilityResult& utility_result,
                                           const UnitSelectionParams& params,
                                           const UnitFrameTable& frame_table) {
  UnitSelectionResult r;
  r.unit_selection_kW = select_installed_power(utility_result.total_power_generation_kW, params);
  r.lookup_power_kW = r.unit_selection_kW;

  const auto hit = frame_table.lookup(r.lookup_power_kW);
  if (hit) {
    r.unit_dimensions_m = hit->value.dimensions_m;
    r.unit_weight_t = hit->value.unit_mass_t;
    r.module_weight_t = hit->value.module_mass_t;
    r.frame_source = hit->clamped ? FrameSource::CatalogClamped : FrameSource::Catalog;
    if (hit->clamped) {
      std::ostringstream oss;
      oss << "installed power " << r.unit_selection_kW << " kW exceeds largest frame "
          << hit->key << " kW; using largest frame";
      log(LogLevel::WARN, "unit_selection", oss.str());
    }
  } else {
    r.unit_dimensions_m = params.default_dimensions_m;
    r.unit_weight_t = params.default_mass_t;
    r.module_weight_t = 0.0;
    r.frame_source = FrameSource::Defaults;
    log(LogLevel::WARN, "unit_selection",
        "frame table '" + frame_table.name() + "' is empty; using default frame");
  }

  if (get_log_level() <= LogLevel::DEBUG) {
    std::ostringstream oss;
    oss << "installed=" << r.unit_selection_kW << " kW, frame="
        << r.unit_dimensions_m[0] << "x" << r.unit_dimensions_m[1] << "x" << r.unit_dimensions_m[2]
        << " m, mass=" << r.unit_weight_t << " t (" << to_string(r.frame_source) << ")";
    log(LogLevel::DEBUG, "unit_selection", oss.str());
  }
  return r;
}

UnitSelectionResult compute_unit_selection(const UtilityResult& utility_result,
                                           const UnitSelectionParams& params) {
  return compute_unit_selection(utility_result, params, default_unit_frame_table());
}

}  // namespace skid
