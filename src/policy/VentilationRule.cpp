#include "hvacpilot/policy/VentilationRule.hpp"

namespace hvacpilot {

double window_fan_speed(double co2_ppm) noexcept {
    if (co2_ppm < Ventilation::CO2_LOW_PPM)  return 0.0;
    if (co2_ppm < Ventilation::CO2_MID_PPM)  return 0.5;
    if (co2_ppm < Ventilation::CO2_HIGH_PPM) return 0.75;
    return 1.0;
}

} // namespace hvacpilot
