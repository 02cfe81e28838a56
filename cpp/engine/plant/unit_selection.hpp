#pragma once
/*
================================================================================
Plant: Unit-Selection Stage
FILE: cpp/engine/plant/unit_selection.hpp

Model:
  - installed = round_half_even(P_gen * margin / step) * step
      (defaults: margin 1.1, step 100 kW)
  - frame     = ceiling lookup of `installed` in the unit-frame catalog;
                catalog overflow clamps to the largest frame; an empty catalog
                falls back to UnitSelectionParams defaults.

Tie-break:
  - Exact .5 quotients round to the even step (2.5 -> 2, 3.5 -> 4).
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/plant/catalog.hpp"
#include "engine/plant/utility_power.hpp"

namespace skid {

enum class FrameSource : int {
  Catalog = 0,          // exact ceiling match
  CatalogClamped = 1,   // above the largest frame, largest used
  Defaults = 2          // catalog empty, UnitSelectionParams used
};

const char* to_string(FrameSource s) noexcept;

struct UnitSelectionResult {
  double unit_selection_kW = 0.0;  // installed power
  double lookup_power_kW = 0.0;    // key used for the frame lookup
  Dimensions unit_dimensions_m = {0.0, 0.0, 0.0};
  double unit_weight_t = 0.0;
  double module_weight_t = 0.0;    // 0 when the frame came from defaults
  FrameSource frame_source = FrameSource::Catalog;
};

// Installed-power rounding on its own (exposed for the report and tests).
double select_installed_power(double total_power_generation_kW,
                              const UnitSelectionParams& params);

UnitSelectionResult compute_unit_selection(const UtilityResult& utility_result,
                                           const UnitSelectionParams& params,
                                           const UnitFrameTable& frame_table);

// Uses default_unit_frame_table().
UnitSelectionResult compute_unit_selection(const UtilityResult& utility_result,
                                           const UnitSelectionParams& params);

}  // namespace skid
