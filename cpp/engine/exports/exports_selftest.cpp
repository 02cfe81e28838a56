/*
  Exports Selftest (Result JSON + Sweep CSV)

  Checks:
    1) JSON carries every section and key, in a stable order.
    2) Non-finite numbers serialize as null, never "nan"/"inf".
    3) Identical inputs give byte-identical JSON.
    4) Sweep CSV keeps a fixed column count for ok and rejected rows and
       quotes fields that contain the delimiter.
    5) File writers report I/O failure instead of throwing.
*/

#include "engine/exports/result_json.hpp"
#include "engine/exports/sweep_csv.hpp"
#include "engine/core/selftest_support.hpp"

#include <cstddef>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace skid;
using namespace skid::selftest;

namespace {

bool contains(const std::string& s, const std::string& needle) {
  return s.find(needle) != std::string::npos;
}

// Number of fields in one CSV line, honoring double-quoted cells.
std::size_t csv_field_count(const std::string& line, char delim = ',') {
  std::size_t n = 1;
  bool quoted = false;
  for (char c : line) {
    if (c == '"') quoted = !quoted;
    else if (c == delim && !quoted) ++n;
  }
  return n;
}

std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream in(s);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

void test_json_layout() {
  const PipelineSettings s = PipelineSettings::defaults(150.0);
  const CombinedResult r = run_pipeline(s);
  const SelectionReport rep = build_selection_report(r, s);
  const std::string j = result_to_json(r, rep);

  const char* keys[] = {
    "\"main_engine\"", "\"input_power\"", "\"main_loss_power\"", "\"main_output_power\"",
    "\"total_power_generation\"", "\"utility_power\"", "\"lubrication_oil_amount\"",
    "\"oil_cooler_circulation_water\"", "\"oil_pump_power\"", "\"oil_pump_clamped\": false",
    "\"utility_self_consumption\"", "\"net_power_output\"", "\"component_powers\"",
    "\"economic_analysis\"", "\"annual_power_generation\"", "\"annual_power_income\"",
    "\"annual_coal_savings\"", "\"annual_coal_cost_savings\"", "\"annual_co2_reduction\"",
    "\"unit_selection\"", "\"unit_dimensions\": [3.000000, 2.500000, 2.500000]",
    "\"frame_source\": \"catalog\"", "\"calculation_summary\"", "\"selected_unit_power\": 100.000000",
    "\"selection_report\"", "\"model\": \"TP100\"", "\"dual_stage\": false", "\"payback_years\": 2.200000",
  };
  for (const char* k : keys) expect_true(contains(j, k), std::string("json has ") + k);

  expect_true(j.find("\"main_engine\"") < j.find("\"utility_power\"") &&
                  j.find("\"utility_power\"") < j.find("\"economic_analysis\"") &&
                  j.find("\"economic_analysis\"") < j.find("\"unit_selection\"") &&
                  j.find("\"unit_selection\"") < j.find("\"calculation_summary\""),
              "section order stable");

  const std::string bare = result_to_json(r);
  expect_true(!contains(bare, "selection_report"), "report omitted when not passed");
  expect_true(!bare.empty() && bare.front() == '{' && bare.back() == '}', "object delimiters");

  expect_eq_str(result_to_json(run_pipeline(s), rep), j, "byte-identical output");
}

void test_json_non_finite() {
  CombinedResult r = run_pipeline(PipelineSettings::defaults(150.0));
  r.economic_analysis.annual_power_income = std::numeric_limits<double>::quiet_NaN();
  r.utility_power.oil_cooler_circulation_water_t_h = std::numeric_limits<double>::infinity();
  const std::string j = result_to_json(r);
  expect_true(contains(j, "\"annual_power_income\": null"), "NaN -> null");
  expect_true(contains(j, "\"oil_cooler_circulation_water\": null"), "inf -> null");
  expect_true(!contains(j, "nan") && !contains(j, "inf"), "no nan/inf tokens");
}

void test_json_file() {
  const PipelineSettings s = PipelineSettings::defaults(2000.0);
  const CombinedResult r = run_pipeline(s);
  const SelectionReport rep = build_selection_report(r, s);

  const std::string path = "skid_exports_selftest.json";
  expect_true(write_result_json_file(r, rep, path), "json file written");

  std::ifstream in(path, std::ios::binary);
  std::stringstream buf;
  buf << in.rdbuf();
  in.close();
  expect_eq_str(buf.str(), result_to_json(r, rep) + "\n", "file content matches");
  expect_true(contains(buf.str(), "\"dual_stage\": true"), "dual stage exported");
  std::remove(path.c_str());

  expect_true(!write_result_json_file(r, rep, "/nonexistent_dir_skid/out.json"), "bad path reports failure");
}

void test_sweep_csv() {
  SweepConfig cfg;
  cfg.from_kW = 0.0;
  cfg.to_kW = 200.0;
  cfg.step_kW = 100.0;
  std::vector<SweepRow> rows = run_scenario_sweep(cfg, PipelineSettings::defaults(1.0));

  SweepRow quoted;
  quoted.main_power_kW = -1.0;
  quoted.ok = false;
  quoted.code = ErrorCode::kParameterRange;
  quoted.message = "bad value, \"quoted\"";
  rows.push_back(quoted);

  const std::string csv = sweep_to_csv(rows);
  const std::vector<std::string> lines = split_lines(csv);
  expect_true(lines.size() == 5, "header + 4 rows");

  const std::size_t cols = csv_field_count(lines[0]);
  expect_true(cols == 24, "24 columns");
  for (std::size_t i = 1; i < lines.size(); ++i) {
    expect_true(csv_field_count(lines[i]) == cols, "row " + std::to_string(i) + " column count");
  }

  expect_true(lines[1].rfind("0.000000,rejected,", 0) == 0, "0 kW row rejected");
  expect_true(lines[2].rfind("100.000000,ok,", 0) == 0, "100 kW row ok");
  expect_true(contains(lines[4], "\"bad value, \"\"quoted\"\"\""), "message escaped");
  expect_true(!contains(csv, "nan"), "no nan in csv");

  CsvExportOptions opt;
  opt.include_header = false;
  opt.delimiter = ';';
  opt.precision = 2;
  const std::vector<std::string> semi = split_lines(sweep_to_csv(rows, opt));
  expect_true(semi.size() == 4, "header suppressed");
  expect_true(semi[1].rfind("100.00;ok;", 0) == 0, "custom delimiter + precision");

  expect_true(!write_sweep_csv_file(rows, "/nonexistent_dir_skid/out.csv"), "bad csv path reports failure");
}

}  // namespace

int main() {
  test_json_layout();
  test_json_non_finite();
  test_json_file();
  test_sweep_csv();
  return finish("exports");
}
