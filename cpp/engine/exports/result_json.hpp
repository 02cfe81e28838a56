#pragma once
/*
================================================================================
Exports: Sizing Result JSON Serializer (Header)
FILE: cpp/engine/exports/result_json.hpp

Purpose:
  - Deterministic JSON export of a pipeline run (+ optional selection report)
    for the transport layer and for archived snapshots.
  - Layout:
      {
        "main_engine": {...},
        "utility_power": {..., "component_powers": {...}},
        "economic_analysis": {...},
        "unit_selection": {..., "unit_dimensions": [L, W, H]},
        "calculation_summary": {...},
        "selection_report": {...}        (when a report is passed)
      }

Hardening:
  - No third-party JSON dependency (simple, controlled emitter).
  - Stable key ordering so diffs between runs are readable.
  - Non-finite numbers serialize as null.
================================================================================
*/

#include "engine/plant/pipeline.hpp"
#include "engine/plant/selection_report.hpp"

#include <string>

namespace skid {

struct JsonWriteOptions {
  int indent_spaces = 2;
  int precision = 6;
};

std::string result_to_json(const CombinedResult& r,
                           const JsonWriteOptions& opt = JsonWriteOptions());

std::string result_to_json(const CombinedResult& r,
                           const SelectionReport& report,
                           const JsonWriteOptions& opt = JsonWriteOptions());

// Write JSON to a file path. Returns true on success, false on failure.
bool write_result_json_file(const CombinedResult& r,
                            const SelectionReport& report,
                            const std::string& file_path,
                            const JsonWriteOptions& opt = JsonWriteOptions());

} // namespace skid
