/*
================================================================================
CLI: Main Entry Point (skid_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end for the skid sizing engine.
  - Provides:
    * run     - size one skid from a shaft-power value, emit JSON
    * sweep   - size a range of shaft-power values, emit CSV
    * tables  - print the equipment catalogs
    * help    - show usage

Usage:
  skid_cli run --main-power <kW> [param flags] [--out <path|->]
  skid_cli sweep --from <kW> --to <kW> --step <kW> [param flags] [--out <path|->]
  skid_cli tables
  skid_cli help

Hardening:
  - Every parameter record is validated before the pipeline runs.
  - Explicit exit codes for CI integration.
  - Deterministic output format.
================================================================================
*/

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/exports/result_json.hpp"
#include "engine/exports/sweep_csv.hpp"
#include "engine/plant/catalog.hpp"
#include "engine/plant/pipeline.hpp"
#include "engine/plant/scenario_sweep.hpp"
#include "engine/plant/selection_report.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace skid;

namespace {

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

void print_help() {
  std::cout << R"(
skid_cli - Power-Generation Skid Sizing Engine

Usage:
  skid_cli run --main-power <kW> [options]
  skid_cli sweep --from <kW> --to <kW> --step <kW> [options]
  skid_cli tables
  skid_cli help

Output:
  --out <path|->            Output file ("-" = stdout, default)
  --precision <n>           Decimal places in JSON/CSV (default 6)
  --log-level <lvl>         debug|info|warn|error|off (default warn)

Main engine:
  --main-power <kW>         Shaft power from the process simulator
  --wheel-loss <f>          (default 0.85)
  --generator-eff <f>       (default 0.85)
  --main-loss <f>           (default 0.80)
  --cooling-loss <f>        (default 0.98)
  --frequency-loss <f>      (default 0.98)
  --wheel-resistance <f>    (default 0.98)

Utility:
  --mech-loss-ratio <f>     (default 0.04)
  --oil-density <kg/m3>     (default 850)
  --oil-cp <kJ/kg.K>        (default 2)
  --oil-temp-rise <K>       (default 8)
  --water-cp <kJ/kg.K>      (default 4.2)
  --heater-share <f>        (default 0.5)
  --loop-pump <kW>          (default 1.0)
  --circulation-pump <kW>   (default 0.5)
  --control-cabinet <kW>    (default 2.0)
  --air-demand <Nm3/h>      (default 4)
  --nitrogen-demand <Nm3/h> (default 40)
  --oil-overflow clamp|throw  Oil pump catalog overflow policy (default clamp)

Economics:
  --hours <h>               Annual operating hours, 0..8760 (default 8000)
  --price <CNY/kWh>         (default 0.6)
  --coal-coefficient <f>    (default 0.35)
  --coal-price <CNY/t>      (default 500)
  --co2-factor <f>          (default 0.96)

Selection:
  --margin <f>              Installed power margin (default 1.1)
  --catalog-step <kW>       Installed power step (default 100)
  --investment-per-kw <f>   10^4 CNY per installed kW (default 1.0)
  --dual-threshold <kW>     Net power above which the skid is split (default 1000)

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
  4 - I/O error
)";
}

struct Args {
  PipelineSettings settings;
  bool main_power_set = false;

  SweepConfig sweep;
  bool from_set = false, to_set = false, step_set = false;

  OverflowPolicy oil_overflow = OverflowPolicy::Clamp;
  std::string out_path = "-";
  int precision = 6;
  LogLevel log_level = LogLevel::WARN;
};

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool parse_int(const char* s, int* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0' || v < 0 || v > 17) return false;
  *out = static_cast<int>(v);
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

struct NumericFlag {
  const char* name;
  double* target;
  bool* seen;  // optional
};

std::vector<NumericFlag> numeric_flags(Args& a) {
  PipelineSettings& s = a.settings;
  return {
    {"--main-power",        &s.main_engine.main_power_kW,            &a.main_power_set},
    {"--wheel-loss",        &s.main_engine.wheel_loss_factor,        nullptr},
    {"--generator-eff",     &s.main_engine.generator_efficiency,     nullptr},
    {"--main-loss",         &s.main_engine.main_loss_factor,         nullptr},
    {"--cooling-loss",      &s.main_engine.cooling_loss_factor,      nullptr},
    {"--frequency-loss",    &s.main_engine.frequency_loss_factor,    nullptr},
    {"--wheel-resistance",  &s.main_engine.wheel_resistance_factor,  nullptr},

    {"--mech-loss-ratio",   &s.utility.mechanical_loss_ratio,        nullptr},
    {"--oil-density",       &s.utility.oil_density_kg_m3,            nullptr},
    {"--oil-cp",            &s.utility.oil_heat_capacity,            nullptr},
    {"--oil-temp-rise",     &s.utility.oil_temp_rise_K,              nullptr},
    {"--water-cp",          &s.utility.cooling_water_cp,             nullptr},
    {"--heater-share",      &s.utility.oil_heater_share,             nullptr},
    {"--loop-pump",         &s.utility.cooling_loop_pump_kW,         nullptr},
    {"--circulation-pump",  &s.utility.circulation_pump_kW,          nullptr},
    {"--control-cabinet",   &s.utility.control_cabinet_kW,           nullptr},
    {"--air-demand",        &s.utility.air_demand_Nm3_h,             nullptr},
    {"--nitrogen-demand",   &s.utility.nitrogen_demand_Nm3_h,        nullptr},

    {"--hours",             &s.economics.annual_operating_hours,     nullptr},
    {"--price",             &s.economics.electricity_price,          nullptr},
    {"--coal-coefficient",  &s.economics.standard_coal_coefficient,  nullptr},
    {"--coal-price",        &s.economics.standard_coal_price,        nullptr},
    {"--co2-factor",        &s.economics.co2_emission_factor,        nullptr},

    {"--margin",            &s.unit.selection_margin,                nullptr},
    {"--catalog-step",      &s.unit.catalog_step_kW,                 nullptr},
    {"--investment-per-kw", &s.report.investment_per_kW,             nullptr},
    {"--dual-threshold",    &s.report.dual_stage_threshold_kW,       nullptr},

    {"--from",              &a.sweep.from_kW,                        &a.from_set},
    {"--to",                &a.sweep.to_kW,                          &a.to_set},
    {"--step",              &a.sweep.step_kW,                        &a.step_set},
  };
}

bool parse_args(int argc, char** argv, int first, Args* a, std::string* err) {
  const std::vector<NumericFlag> flags = numeric_flags(*a);

  for (int i = first; i < argc; ++i) {
    const char* k = argv[i];

    bool matched = false;
    for (const auto& f : flags) {
      if (std::strcmp(k, f.name) != 0) continue;
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = std::string(k) + " requires a value"; return false; }
      if (!parse_double(v, f.target)) { *err = std::string(k) + " must be a finite number"; return false; }
      if (f.seen) *f.seen = true;
      matched = true;
      break;
    }
    if (matched) continue;

    if (std::strcmp(k, "--out") == 0) {
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = "--out requires a value"; return false; }
      a->out_path = v;
      continue;
    }

    if (std::strcmp(k, "--precision") == 0) {
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = "--precision requires a value"; return false; }
      if (!parse_int(v, &a->precision)) { *err = "--precision must be an integer in [0,17]"; return false; }
      continue;
    }

    if (std::strcmp(k, "--log-level") == 0) {
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = "--log-level requires a value"; return false; }
      if (!parse_log_level(v, &a->log_level)) { *err = "--log-level must be debug|info|warn|error|off"; return false; }
      continue;
    }

    if (std::strcmp(k, "--oil-overflow") == 0) {
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = "--oil-overflow requires clamp|throw"; return false; }
      if (std::strcmp(v, "clamp") == 0) a->oil_overflow = OverflowPolicy::Clamp;
      else if (std::strcmp(v, "throw") == 0) a->oil_overflow = OverflowPolicy::Throw;
      else { *err = "--oil-overflow must be clamp or throw"; return false; }
      continue;
    }

    *err = std::string("Unknown argument: ") + k;
    return false;
  }
  return true;
}

// Throws Error{kIoError} when the destination cannot be written.
void write_output(const std::string& path, const std::string& data) {
  if (path == "-") {
    std::cout << data;
    std::cout.flush();
    SKID_ENSURE(std::cout.good(), ErrorCode::kIoError, "failed to write stdout");
    return;
  }
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  SKID_ENSURE(f.good(), ErrorCode::kIoError, "cannot open " + path);
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  SKID_ENSURE(f.good(), ErrorCode::kIoError, "failed to write " + path);
}

int exit_code_for(const Error& e) {
  switch (e.code()) {
    case ErrorCode::kInvalidInput:
    case ErrorCode::kParameterRange:
      return VALIDATION_FAILED;
    case ErrorCode::kIoError:
      return IO_ERROR;
    default:
      return COMPUTATION_FAILED;
  }
}

int cmd_run(const Args& a) {
  if (!a.main_power_set) {
    std::cerr << "Argument error: run requires --main-power\n";
    return INVALID_ARGS;
  }
  try {
    a.settings.validate_or_throw();

    const OilPumpTable oil = default_oil_pump_table().with_policy(a.oil_overflow);
    PipelineTables tables = PipelineTables::defaults();
    tables.oil_pump = &oil;

    const CombinedResult result = run_pipeline(a.settings, tables);
    const SelectionReport report = build_selection_report(result, a.settings, tables);

    JsonWriteOptions jopt;
    jopt.precision = a.precision;
    write_output(a.out_path, result_to_json(result, report, jopt) + "\n");
    return SUCCESS;

  } catch (const Error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return exit_code_for(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return COMPUTATION_FAILED;
  }
}

int cmd_sweep(const Args& a) {
  if (!a.from_set || !a.to_set || !a.step_set) {
    std::cerr << "Argument error: sweep requires --from, --to and --step\n";
    return INVALID_ARGS;
  }
  try {
    // main_power is supplied per point; validate the factors with a stand-in.
    MainEngineParams probe = a.settings.main_engine;
    probe.main_power_kW = 1.0;
    probe.validate_or_throw();
    a.sweep.validate();
    a.settings.utility.validate_or_throw();
    a.settings.economics.validate_or_throw();
    a.settings.unit.validate_or_throw();
    a.settings.report.validate_or_throw();

    const OilPumpTable oil = default_oil_pump_table().with_policy(a.oil_overflow);
    PipelineTables tables = PipelineTables::defaults();
    tables.oil_pump = &oil;

    const std::vector<SweepRow> rows = run_scenario_sweep(a.sweep, a.settings, tables);

    CsvExportOptions copt;
    copt.precision = a.precision;
    write_output(a.out_path, sweep_to_csv(rows, copt));
    return SUCCESS;

  } catch (const Error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return exit_code_for(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return COMPUTATION_FAILED;
  }
}

int cmd_tables() {
  const OilPumpTable& oil = default_oil_pump_table();
  std::cout << "=== " << oil.name() << " (oil amount -> pump kW) ===\n";
  for (const auto& row : oil.rows()) {
    std::cout << "  <= " << std::setw(8) << row.key << "  ->  " << row.value << " kW\n";
  }

  const UnitFrameTable& frames = default_unit_frame_table();
  std::cout << "\n=== " << frames.name() << " (installed kW -> L x W x H, mass) ===\n";
  for (const auto& row : frames.rows()) {
    const UnitFrame& f = row.value;
    std::cout << "  <= " << std::setw(8) << row.key << "  ->  "
              << f.dimensions_m[0] << " x " << f.dimensions_m[1] << " x " << f.dimensions_m[2] << " m, "
              << f.unit_mass_t << " t / " << f.module_mass_t << " t\n";
  }
  return SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return SUCCESS;
  }

  if (cmd == "tables") {
    return cmd_tables();
  }

  if (cmd != "run" && cmd != "sweep") {
    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'skid_cli help' for usage information.\n";
    return INVALID_ARGS;
  }

  Args a;
  std::string err;
  if (!parse_args(argc, argv, 2, &a, &err)) {
    std::cerr << "Argument error: " << err << "\n";
    std::cerr << "Run 'skid_cli help' for usage information.\n";
    return INVALID_ARGS;
  }
  set_log_level(a.log_level);

  return (cmd == "run") ? cmd_run(a) : cmd_sweep(a);
}
