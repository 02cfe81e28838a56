#pragma once
/*
================================================================================
Plant: Main-Engine Stage
FILE: cpp/engine/plant/main_engine.hpp

Model:
  - Downstream efficiency chain  eta = cooling * frequency * wheel_resistance
  - Mechanical output            P_out  = P_shaft * eta
  - Mechanical loss              P_loss = P_shaft * (1 - main_loss) * eta
  - Generated electrical power   P_gen  = P_out * wheel_loss * generator_eff

Notes:
  - Negative shaft power (absorbing machinery) is valid and propagates with
    its sign. Zero or non-finite shaft power is rejected.
================================================================================
*/

#include "engine/core/settings.hpp"

namespace skid {

struct MainEngineResult {
  double input_power_kW = 0.0;
  double main_loss_power_kW = 0.0;
  double main_output_power_kW = 0.0;
  double total_power_generation_kW = 0.0;
};

MainEngineResult compute_main_engine(const MainEngineParams& params);

}  // namespace skid
