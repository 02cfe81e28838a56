/*
===============================================================================
Plant: Scenario Sweep (Batch Evaluator over Shaft Power)
File: cpp/engine/plant/scenario_sweep.hpp
===============================================================================
*/

#pragma once

#include "engine/core/settings.hpp"
#include "engine/plant/pipeline.hpp"
#include "engine/plant/selection_report.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace skid {

struct SweepConfig final {
    double from_kW = 0.0;
    double to_kW = 0.0;
    double step_kW = 0.0;

    // Hard cap so a typo in step cannot allocate millions of rows.
    std::size_t max_points = 100000;

    void validate() const {
        require_finite(from_kW, ErrorCode::kInvalidInput, "SweepConfig.from_kW");
        require_finite(to_kW, ErrorCode::kInvalidInput, "SweepConfig.to_kW");
        require_positive(step_kW, ErrorCode::kInvalidInput, "SweepConfig.step_kW");
        SKID_ENSURE(to_kW >= from_kW, ErrorCode::kInvalidInput, "SweepConfig: to_kW < from_kW");
        SKID_ENSURE(span_steps() + 1.0 <= static_cast<double>(max_points), ErrorCode::kInvalidInput,
                    "SweepConfig: too many points");
    }

    // from, from+step, ... up to and including `to` (within step*1e-9).
    // Call after validate().
    std::size_t point_count() const {
        return static_cast<std::size_t>(span_steps()) + 1;
    }

private:
    double span_steps() const {
        return std::floor((to_kW - from_kW) / step_kW + 1e-9);
    }
};

struct SweepRow final {
    double main_power_kW = 0.0;
    bool ok = false;
    ErrorCode code = ErrorCode::kInternal;  // meaningful only when !ok
    std::string message;
    CombinedResult result;
    SelectionReport report;
};

// Runs one pipeline per shaft-power point. A point the pipeline rejects
// (e.g. exactly 0 kW) is recorded with ok=false and the sweep continues.
std::vector<SweepRow> run_scenario_sweep(const SweepConfig& cfg,
                                         const PipelineSettings& base,
                                         const PipelineTables& tables = PipelineTables::defaults());

} // namespace skid
