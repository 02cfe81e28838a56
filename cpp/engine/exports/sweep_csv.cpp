/*
================================================================================
Exports: Scenario Sweep CSV Exporter (Implementation)
FILE: cpp/engine/exports/sweep_csv.cpp
================================================================================
*/

#include "engine/exports/sweep_csv.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace skid {

// Helper: escape CSV string (quote if contains delimiter/quote/newline)
static std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }

  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

// Helper: format double, or empty string if NaN/Inf
static std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

std::string get_sweep_csv_header(const CsvExportOptions& opt) {
  std::ostringstream h;
  const char d = opt.delimiter;

  h << "main_power_kW" << d << "status" << d;

  // Main engine
  h << "main_loss_power_kW" << d
    << "main_output_power_kW" << d
    << "total_power_generation_kW" << d;

  // Utility
  h << "lubrication_oil_amount" << d
    << "oil_cooler_circulation_water_t_h" << d
    << "oil_pump_power_kW" << d
    << "utility_self_consumption_kW" << d
    << "net_power_output_kW" << d;

  // Economics
  h << "annual_power_generation_1e4kWh" << d
    << "annual_power_income" << d
    << "annual_coal_savings" << d
    << "annual_coal_cost_savings" << d
    << "annual_co2_reduction" << d;

  // Selection
  h << "model" << d
    << "installed_power_kW" << d
    << "length_m" << d << "width_m" << d << "height_m" << d
    << "unit_weight_t" << d
    << "dual_stage" << d
    << "payback_years" << d
    << "error";

  return h.str();
}

std::string sweep_row_to_csv(const SweepRow& row, const CsvExportOptions& opt) {
  std::ostringstream o;
  const char d = opt.delimiter;
  const int p = opt.precision;

  o << csv_double(row.main_power_kW, p) << d << (row.ok ? "ok" : "rejected") << d;

  if (!row.ok) {
    // Keep the column count: 21 empty cells, then the error.
    for (int i = 0; i < 21; ++i) o << d;
    o << csv_escape(row.message, d);
    return o.str();
  }

  const auto& m = row.result.main_engine;
  const auto& u = row.result.utility_power;
  const auto& e = row.result.economic_analysis;
  const auto& r = row.report;

  o << csv_double(m.main_loss_power_kW, p) << d
    << csv_double(m.main_output_power_kW, p) << d
    << csv_double(m.total_power_generation_kW, p) << d;

  o << csv_double(u.lubrication_oil_amount, p) << d
    << csv_double(u.oil_cooler_circulation_water_t_h, p) << d
    << csv_double(u.oil_pump_power_kW, p) << d
    << csv_double(u.utility_self_consumption_kW, p) << d
    << csv_double(u.net_power_output_kW, p) << d;

  o << csv_double(e.annual_power_generation, p) << d
    << csv_double(e.annual_power_income, p) << d
    << csv_double(e.annual_coal_savings, p) << d
    << csv_double(e.annual_coal_cost_savings, p) << d
    << csv_double(e.annual_co2_reduction, p) << d;

  o << csv_escape(r.model, d) << d
    << csv_double(r.installed_power_kW, p) << d
    << csv_double(r.unit_dimensions_m[0], p) << d
    << csv_double(r.unit_dimensions_m[1], p) << d
    << csv_double(r.unit_dimensions_m[2], p) << d
    << csv_double(r.unit_weight_t, p) << d
    << (r.layout.dual_stage ? "1" : "0") << d
    << csv_double(r.payback_years, p) << d;
  // error column empty

  return o.str();
}

std::string sweep_to_csv(const std::vector<SweepRow>& rows, const CsvExportOptions& opt) {
  std::ostringstream o;
  if (opt.include_header) o << get_sweep_csv_header(opt) << "\n";
  for (const auto& r : rows) o << sweep_row_to_csv(r, opt) << "\n";
  return o.str();
}

bool write_sweep_csv_file(const std::vector<SweepRow>& rows,
                          const std::string& file_path,
                          const CsvExportOptions& opt) {
  std::ofstream ofs(file_path);
  if (!ofs.is_open()) return false;
  ofs << sweep_to_csv(rows, opt);
  return ofs.good();
}

}  // namespace skid
