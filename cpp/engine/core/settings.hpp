#pragma once
/*
================================================================================
Core: Stage Parameter Records
FILE: cpp/engine/core/settings.hpp

Purpose:
  - One validated record per pipeline stage, carrying the engineering
    constants that stage needs. Every default is named here and nowhere else,
    so any number in a result can be traced back to a field of a record.

Hardening:
  - validate_or_throw() rejects nonsensical values before a stage runs.
  - EconomicParams::make() validates at construction; out-of-range economics
    never reach the economic stage.
  - Explicit units on every field.
================================================================================
*/

#include <array>
#include <string>

#include "engine/core/error.hpp"
#include "engine/core/numeric.hpp"
#include "engine/core/units.hpp"

namespace skid {

// Length x width x height of a skid enclosure, meters.
using Dimensions = std::array<double, 3>;

// ----------------------------- Main engine -----------------------------------
struct MainEngineParams {
  // Shaft power from the process simulator (kW). Negative for absorbing
  // machinery; the sign propagates through every downstream figure.
  double main_power_kW = 0.0;

  // Dimensionless loss / efficiency factors, all in (0,1].
  double wheel_loss_factor       = 0.85;
  double generator_efficiency    = 0.85;
  double main_loss_factor        = 0.80;
  double cooling_loss_factor     = 0.98;
  double frequency_loss_factor   = 0.98;
  double wheel_resistance_factor = 0.98;

  void validate_or_throw() const {
    require_finite(main_power_kW, ErrorCode::kInvalidInput, "MainEngineParams: main_power_kW");
    SKID_ENSURE(main_power_kW != 0.0, ErrorCode::kInvalidInput,
                "MainEngineParams: main_power_kW must be non-zero");
    require_fraction(wheel_loss_factor, ErrorCode::kInvalidInput, "MainEngineParams: wheel_loss_factor");
    require_fraction(generator_efficiency, ErrorCode::kInvalidInput, "MainEngineParams: generator_efficiency");
    require_fraction(main_loss_factor, ErrorCode::kInvalidInput, "MainEngineParams: main_loss_factor");
    require_fraction(cooling_loss_factor, ErrorCode::kInvalidInput, "MainEngineParams: cooling_loss_factor");
    require_fraction(frequency_loss_factor, ErrorCode::kInvalidInput, "MainEngineParams: frequency_loss_factor");
    require_fraction(wheel_resistance_factor, ErrorCode::kInvalidInput, "MainEngineParams: wheel_resistance_factor");
  }

  static MainEngineParams defaults(double main_power_kW) {
    MainEngineParams p;
    p.main_power_kW = main_power_kW;
    return p;
  }
};

// ----------------------------- Utility ---------------------------------------
struct UtilityParams {
  // Fraction of main output power dissipated as mechanical (bearing/seal) loss.
  double mechanical_loss_ratio = 0.04;

  // Lubrication oil
  double oil_density_kg_m3     = 850.0;
  double oil_heat_capacity     = 2.0;    // kJ/kg.K
  double oil_temp_rise_K       = 8.0;    // oil-cooler water-side temperature rise

  // Cooling water specific heat (kJ/kg.K)
  double cooling_water_cp      = 4.2;

  // Lubrication oil heater draw as a share of oil pump power.
  double oil_heater_share      = 0.5;

  // Fixed auxiliary draws (kW)
  double cooling_loop_pump_kW  = 1.0;
  double circulation_pump_kW   = 0.5;
  double control_cabinet_kW    = 2.0;

  // Instrument gas demand (Nm3/h), reported only.
  double air_demand_Nm3_h      = 4.0;
  double nitrogen_demand_Nm3_h = 40.0;

  void validate_or_throw() const {
    require_fraction(mechanical_loss_ratio, ErrorCode::kInvalidInput, "UtilityParams: mechanical_loss_ratio");
    require_positive(oil_density_kg_m3, ErrorCode::kInvalidInput, "UtilityParams: oil_density_kg_m3");
    require_positive(oil_heat_capacity, ErrorCode::kInvalidInput, "UtilityParams: oil_heat_capacity");
    require_positive(oil_temp_rise_K, ErrorCode::kInvalidInput, "UtilityParams: oil_temp_rise_K");
    require_positive(cooling_water_cp, ErrorCode::kInvalidInput, "UtilityParams: cooling_water_cp");
    require_nonnegative(oil_heater_share, ErrorCode::kInvalidInput, "UtilityParams: oil_heater_share");
    require_nonnegative(cooling_loop_pump_kW, ErrorCode::kInvalidInput, "UtilityParams: cooling_loop_pump_kW");
    require_nonnegative(circulation_pump_kW, ErrorCode::kInvalidInput, "UtilityParams: circulation_pump_kW");
    require_nonnegative(control_cabinet_kW, ErrorCode::kInvalidInput, "UtilityParams: control_cabinet_kW");
    require_nonnegative(air_demand_Nm3_h, ErrorCode::kInvalidInput, "UtilityParams: air_demand_Nm3_h");
    require_nonnegative(nitrogen_demand_Nm3_h, ErrorCode::kInvalidInput, "UtilityParams: nitrogen_demand_Nm3_h");
  }

  static UtilityParams defaults() {
    UtilityParams p;
    return p;
  }
};

// ----------------------------- Economics -------------------------------------
struct EconomicParams {
  double annual_operating_hours    = 8000.0;  // h, [0, 8760]
  double electricity_price         = 0.6;     // CNY/kWh
  double standard_coal_coefficient = 0.35;    // t coal per 10^4 kWh reporting unit
  double standard_coal_price       = 500.0;   // CNY/t
  double co2_emission_factor       = 0.96;    // t CO2 per reporting unit

  void validate_or_throw() const {
    SKID_ENSURE(is_finite(annual_operating_hours) && annual_operating_hours >= 0.0 &&
                    annual_operating_hours <= units::h_per_year,
                ErrorCode::kParameterRange,
                "EconomicParams: annual_operating_hours must be in [0, 8760]");
    require_nonnegative(electricity_price, ErrorCode::kParameterRange, "EconomicParams: electricity_price");
    require_nonnegative(standard_coal_coefficient, ErrorCode::kParameterRange,
                        "EconomicParams: standard_coal_coefficient");
    require_nonnegative(standard_coal_price, ErrorCode::kParameterRange, "EconomicParams: standard_coal_price");
    require_nonnegative(co2_emission_factor, ErrorCode::kParameterRange, "EconomicParams: co2_emission_factor");
  }

  // Checked construction: throws Error{kParameterRange} instead of handing
  // an out-of-range record to the economic stage.
  static EconomicParams make(double annual_operating_hours,
                             double electricity_price,
                             double standard_coal_coefficient,
                             double standard_coal_price,
                             double co2_emission_factor) {
    EconomicParams p;
    p.annual_operating_hours = annual_operating_hours;
    p.electricity_price = electricity_price;
    p.standard_coal_coefficient = standard_coal_coefficient;
    p.standard_coal_price = standard_coal_price;
    p.co2_emission_factor = co2_emission_factor;
    p.validate_or_throw();
    return p;
  }

  static EconomicParams defaults() {
    EconomicParams p;
    return p;
  }
};

// ----------------------------- Unit selection --------------------------------
struct UnitSelectionParams {
  // Frame used only when the unit catalog yields no entry.
  Dimensions default_dimensions_m = {3.0, 2.5, 2.5};
  double default_mass_t           = 15.0;

  // Installed power = round(total * margin / step) * step
  double selection_margin = 1.1;
  double catalog_step_kW  = 100.0;

  void validate_or_throw() const {
    for (double d : default_dimensions_m) {
      require_positive(d, ErrorCode::kInvalidInput, "UnitSelectionParams: default_dimensions_m");
    }
    require_positive(default_mass_t, ErrorCode::kInvalidInput, "UnitSelectionParams: default_mass_t");
    // margin >= 1: installed rating never below generated power.
    SKID_ENSURE(is_finite(selection_margin) && selection_margin >= 1.0,
                ErrorCode::kInvalidInput, "UnitSelectionParams: selection_margin must be >= 1");
    require_positive(catalog_step_kW, ErrorCode::kInvalidInput, "UnitSelectionParams: catalog_step_kW");
  }

  static UnitSelectionParams defaults() {
    UnitSelectionParams p;
    return p;
  }
};

// ----------------------------- Report ----------------------------------------
// Knobs for the selection report that sits on top of the pipeline.
struct ReportSettings {
  // Investment cost per installed kW, in 10^4 CNY.
  double investment_per_kW = 1.0;

  // Above this net power the skid is split into two stages (kW).
  double dual_stage_threshold_kW = 1000.0;

  // Model designation prefix: "TP" + installed kW.
  std::string model_prefix = "TP";

  void validate_or_throw() const {
    require_nonnegative(investment_per_kW, ErrorCode::kParameterRange, "ReportSettings: investment_per_kW");
    require_positive(dual_stage_threshold_kW, ErrorCode::kParameterRange,
                     "ReportSettings: dual_stage_threshold_kW");
    SKID_ENSURE(!model_prefix.empty(), ErrorCode::kInvalidInput, "ReportSettings: model_prefix empty");
  }
};

// ----------------------------- Aggregate -------------------------------------
// Everything one pipeline run needs besides the catalog tables.
struct PipelineSettings {
  MainEngineParams main_engine;
  UtilityParams utility;
  EconomicParams economics;
  UnitSelectionParams unit;
  ReportSettings report;

  void validate_or_throw() const {
    main_engine.validate_or_throw();
    utility.validate_or_throw();
    economics.validate_or_throw();
    unit.validate_or_throw();
    report.validate_or_throw();
  }

  static PipelineSettings defaults(double main_power_kW) {
    PipelineSettings s;
    s.main_engine = MainEngineParams::defaults(main_power_kW);
    return s;
  }
};

}  // namespace skid
