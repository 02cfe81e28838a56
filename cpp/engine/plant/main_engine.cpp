#include "engine/plant/main_engine.hpp"

#include "engine/core/logging.hpp"

#include <sstream>

namespace skid {

MainEngineResult compute_main_engine(const MainEngineParams& params) {
  params.validate_or_throw();

  const double p = params.main_power_kW;

  MainEngineResult r;
  r.input_power_kW = p;

  r.main_loss_power_kW = p * (1.0 - params.main_loss_factor) *
                         params.cooling_loss_factor *
                         params.frequency_loss_factor *
                         params.wheel_resistance_factor;

  r.main_output_power_kW = p *
                           params.cooling_loss_factor *
                           params.frequency_loss_factor *
                           params.wheel_resistance_factor;

  r.total_power_generation_kW = r.main_output_power_kW *
                                params.wheel_loss_factor *
                                params.generator_efficiency;

  if (get_log_level() <= LogLevel::DEBUG) {
    std::ostringstream oss;
    oss << "P_shaft=" << p << " kW, P_loss=" << r.main_loss_power_kW
        << " kW, P_out=" << r.main_output_power_kW
        << " kW, P_gen=" << r.total_power_generation_kW << " kW";
    log(LogLevel::DEBUG, "main_engine", oss.str());
  }
  return r;
}

}  // namespace skid
