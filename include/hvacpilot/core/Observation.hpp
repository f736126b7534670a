#pragma once

#include <array>
#include <climits>
#include <cstddef>
#include <vector>

namespace hvacpilot {

// ---------------------------------------------------------------------------
// One environment observation. Field order is fixed by the simulator:
//
//   0 month            5 htg_setpoint     10 air_co2
//   1 day_of_month     6 clg_setpoint     11 window_fan_energy
//   2 hour             7 air_temperature  12 pmv
//   3 outdoor_temp     8 air_humidity     13 ppd
//   4 outdoor_humidity 9 people_occupant  14 total_electricity_hvac
//
// The policy only reads month, air_temperature and air_co2. The rest is
// carried through for logging.
// ---------------------------------------------------------------------------
class Observation {
public:
    static constexpr std::size_t SIZE = 15;

    enum Field : std::size_t {
        MONTH = 0,
        DAY_OF_MONTH = 1,
        HOUR = 2,
        OUTDOOR_TEMPERATURE = 3,
        OUTDOOR_HUMIDITY = 4,
        HTG_SETPOINT = 5,
        CLG_SETPOINT = 6,
        AIR_TEMPERATURE = 7,
        AIR_HUMIDITY = 8,
        PEOPLE_OCCUPANT = 9,
        AIR_CO2 = 10,
        WINDOW_FAN_ENERGY = 11,
        PMV = 12,
        PPD = 13,
        TOTAL_ELECTRICITY_HVAC = 14
    };

    Observation() = default;
    explicit Observation(const std::array<double, SIZE>& values) : values_(values) {}

    // Boundary check for untrusted input. Throws std::invalid_argument when
    // the length is not SIZE or any value is NaN/inf.
    static Observation from_values(const std::vector<double>& values);

    // Month truncated toward zero, as the simulator reports it as a float.
    // Values outside the int range read as 0, which no season claims.
    int month() const noexcept {
        const double m = values_[MONTH];
        if (!(m > static_cast<double>(INT_MIN) - 1.0 && m < static_cast<double>(INT_MAX) + 1.0)) {
            return 0;
        }
        return static_cast<int>(m);
    }
    double air_temperature() const noexcept { return values_[AIR_TEMPERATURE]; }
    double air_co2() const noexcept { return values_[AIR_CO2]; }

    double operator[](std::size_t i) const noexcept { return values_[i]; }

    const std::array<double, SIZE>& values() const noexcept { return values_; }

private:
    std::array<double, SIZE> values_{};
};

} // namespace hvacpilot
