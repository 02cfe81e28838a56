#pragma once
/*
================================================================================
Core: Units + Conversions
FILE: cpp/engine/core/units.hpp

Purpose:
  - Name the fixed conversion constants the sizing formulas rely on, so the
    stage code never carries bare magic numbers.
  - Reporting conventions (10^4 kWh, 10^4 CNY) live here too; they are part
    of the output contract and must not be "corrected".
================================================================================
*/

namespace skid::units {

// Time
inline constexpr double s_per_min   = 60.0;
inline constexpr double h_per_year  = 8760.0;

// Volume
inline constexpr double L_per_m3    = 1000.0;

// Cooling-water flow: kW / (kJ/kg.K * K) = kg/s; * 3.6 = t/h
inline constexpr double kg_s_to_t_h = 3.6;

// Energy reporting: annual figures are quoted in units of 10^4 kWh.
inline constexpr double kWh_per_reporting_unit = 10000.0;

}  // namespace skid::units
