/*
================================================================================
Plant: Equipment Catalog Tables (Implementation)
FILE: cpp/engine/plant/catalog.cpp
================================================================================
*/

#include "engine/plant/catalog.hpp"

#include <vector>

namespace skid {

static OilPumpTable build_oil_pump_table() {
  // Oil amount breakpoint -> pump motor kW
  std::vector<OilPumpTable::Row> rows = {
    {  28.4,  1.5},
    {  37.9,  1.5},
    {  60.0,  2.2},
    {  80.0,  3.0},
    { 108.0,  4.0},
    { 157.0,  5.5},
    { 189.0,  7.5},
    { 225.0,  7.5},
    { 277.0, 11.0},
    { 319.0, 11.0},
    { 401.0, 15.0},
    { 471.0, 15.0},
    { 536.0, 15.0},
    { 596.0, 18.5},
    { 662.0, 22.0},
    { 846.0, 30.0},
    {1035.0, 30.0},
  };
  return OilPumpTable("oil_pump_table", std::move(rows), OverflowPolicy::Clamp);
}

static UnitFrameTable build_unit_frame_table() {
  // Installed kW -> {L, W, H}, skid mass t, heaviest lift t
  std::vector<UnitFrameTable::Row> rows = {
    {   0.0, {{ 3.0, 2.5, 2.5}, 14.0,  5.0}},
    { 250.0, {{ 3.0, 2.5, 2.5}, 15.0,  5.0}},
    { 400.0, {{ 3.5, 2.5, 2.5}, 16.0,  5.0}},
    { 450.0, {{ 4.0, 2.5, 2.5}, 17.0,  5.0}},
    { 500.0, {{ 4.5, 2.5, 2.5}, 17.0,  6.0}},
    { 560.0, {{ 4.5, 3.0, 2.5}, 18.0,  8.0}},
    { 630.0, {{ 5.0, 3.0, 2.5}, 20.0,  9.0}},
    { 710.0, {{ 5.5, 3.0, 2.5}, 22.0, 10.0}},
    { 800.0, {{ 6.0, 3.0, 2.5}, 24.0, 11.0}},
    { 900.0, {{ 6.5, 3.0, 2.5}, 25.0, 12.0}},
    {1120.0, {{ 6.5, 3.0, 2.5}, 26.0, 12.0}},
    {1250.0, {{ 6.5, 3.0, 2.5}, 27.0, 13.0}},
    {1400.0, {{ 7.0, 3.0, 2.5}, 28.0, 13.0}},
    {1600.0, {{ 7.5, 3.0, 2.5}, 29.0, 14.0}},
    {1800.0, {{ 8.0, 3.5, 2.5}, 30.0, 15.0}},
    {2000.0, {{ 8.5, 3.5, 2.5}, 31.0, 16.0}},
    {2240.0, {{ 9.0, 3.5, 2.5}, 32.0, 16.0}},
    {2500.0, {{ 9.5, 4.0, 2.5}, 33.0, 16.0}},
    {2800.0, {{ 9.5, 4.0, 2.5}, 34.0, 17.0}},
    {3150.0, {{10.5, 4.0, 2.5}, 35.0, 17.0}},
    {3550.0, {{11.0, 4.0, 2.5}, 38.0, 18.0}},
    {4000.0, {{12.0, 4.0, 2.5}, 40.0, 18.0}},
    {7000.0, {{12.0, 6.0, 4.0}, 50.0, 20.0}},
  };
  return UnitFrameTable("unit_frame_table", std::move(rows), OverflowPolicy::Clamp);
}

const OilPumpTable& default_oil_pump_table() {
  static const OilPumpTable table = build_oil_pump_table();
  return table;
}

const UnitFrameTable& default_unit_frame_table() {
  static const UnitFrameTable table = build_unit_frame_table();
  return table;
}

}  // namespace skid
