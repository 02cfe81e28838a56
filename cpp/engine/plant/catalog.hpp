#pragma once
/*
================================================================================
Plant: Equipment Catalog Tables
FILE: cpp/engine/plant/catalog.hpp

Purpose:
  - The two vendor catalogs the sizing stages resolve against:
      * Oil-pump table:   lubrication oil amount -> pump motor power (kW)
      * Unit-frame table: installed power (kW)   -> enclosure + mass
  - Defaults are process-lifetime immutable tables. Stages take the table as
    an argument, so tests and what-if studies can pass their own variants.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/plant/ceiling_table.hpp"

namespace skid {

// Enclosure and mass of one catalog frame.
struct UnitFrame {
  Dimensions dimensions_m = {0.0, 0.0, 0.0};  // L x W x H
  double unit_mass_t = 0.0;                   // complete skid
  double module_mass_t = 0.0;                 // heaviest single lift
};

using OilPumpTable = CeilingTable<double>;
using UnitFrameTable = CeilingTable<UnitFrame>;

// Catalog shipped with the engine (clamp-on-overflow).
const OilPumpTable& default_oil_pump_table();
const UnitFrameTable& default_unit_frame_table();

}  // namespace skid
