#pragma once
/*
================================================================================
Exports: Scenario Sweep CSV Exporter
FILE: cpp/engine/exports/sweep_csv.hpp

Purpose:
  - One row per shaft-power point of a scenario sweep, for spreadsheet
    comparison of candidate skids.
  - Deterministic column ordering for diff-friendly output.

Hardening:
  - Explicit CSV escaping for strings with commas/quotes
  - NaN/unset values and rejected points export as empty cells (not "nan")
  - Header row carries units in column names
================================================================================
*/

#include "engine/plant/scenario_sweep.hpp"

#include <string>
#include <vector>

namespace skid {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 6;
};

std::string get_sweep_csv_header(const CsvExportOptions& opt = CsvExportOptions());

// One CSV row (without newline).
std::string sweep_row_to_csv(const SweepRow& row, const CsvExportOptions& opt = CsvExportOptions());

// Header (optional) + every row, newline-terminated.
std::string sweep_to_csv(const std::vector<SweepRow>& rows, const CsvExportOptions& opt = CsvExportOptions());

// Returns true on success, false on I/O error.
bool write_sweep_csv_file(const std::vector<SweepRow>& rows,
                          const std::string& file_path,
                          const CsvExportOptions& opt = CsvExportOptions());

}  // namespace skid
