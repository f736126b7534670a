#pragma once

namespace hvacpilot {

namespace Ventilation {
    // Lower bound of each band is inclusive.
    constexpr double CO2_LOW_PPM = 800.0;
    constexpr double CO2_MID_PPM = 1000.0;
    constexpr double CO2_HIGH_PPM = 1200.0;

    // Above this the CO2 patience counter runs. Strict, unlike the band edges.
    constexpr double CO2_PATIENCE_PPM = 800.0;
}

// Window-fan speed from indoor CO2:
//   <800 -> 0.0, [800,1000) -> 0.5, [1000,1200) -> 0.75, >=1200 -> 1.0
double window_fan_speed(double co2_ppm) noexcept;

} // namespace hvacpilot
