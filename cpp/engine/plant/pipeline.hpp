#pragma once
/*
================================================================================
Plant: Sizing Pipeline Orchestrator
FILE: cpp/engine/plant/pipeline.hpp

Order:
  main_engine -> utility -> { economics, unit_selection }

The orchestrator only wires results forward and fills the summary; every
number is computed by a stage. Economic parameters are range-checked before
the first stage runs (Error{kParameterRange}), so a hand-built record cannot
push non-finite or out-of-range figures into the result.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/plant/catalog.hpp"
#include "engine/plant/economics.hpp"
#include "engine/plant/main_engine.hpp"
#include "engine/plant/unit_selection.hpp"
#include "engine/plant/utility_power.hpp"

namespace skid {

// Catalogs a run resolves against. Non-owning: tables must outlive the run.
struct PipelineTables {
  const OilPumpTable* oil_pump = nullptr;
  const UnitFrameTable* unit_frame = nullptr;

  static PipelineTables defaults() {
    return PipelineTables{&default_oil_pump_table(), &default_unit_frame_table()};
  }
};

struct CalculationSummary {
  double input_main_power_kW = 0.0;
  double final_net_power_kW = 0.0;
  double annual_income = 0.0;
  double selected_unit_power_kW = 0.0;
};

struct CombinedResult {
  MainEngineResult main_engine;
  UtilityResult utility_power;
  EconomicResult economic_analysis;
  UnitSelectionResult unit_selection;
  CalculationSummary calculation_summary;
};

CombinedResult run_pipeline(const MainEngineParams& main_params,
                            const UtilityParams& utility_params,
                            const EconomicParams& economic_params,
                            const UnitSelectionParams& unit_params,
                            const PipelineTables& tables);

CombinedResult run_pipeline(const MainEngineParams& main_params,
                            const UtilityParams& utility_params,
                            const EconomicParams& economic_params,
                            const UnitSelectionParams& unit_params);

// Convenience over the aggregate settings record.
CombinedResult run_pipeline(const PipelineSettings& settings,
                            const PipelineTables& tables = PipelineTables::defaults());

}  // namespace skid
