#pragma once

#include <set>

namespace hvacpilot {

struct ComfortBand {
    double low{0.0};
    double high{0.0};

    double midpoint() const noexcept { return 0.5 * (low + high); }
    bool above(double t) const noexcept { return t > high; }
    bool below(double t) const noexcept { return t < low; }
    bool contains(double t) const noexcept { return !above(t) && !below(t); }
};

namespace Comfort {
    constexpr double WINTER_LOW = 20.0;
    constexpr double WINTER_HIGH = 23.0;
    constexpr double SUMMER_LOW = 23.0;
    constexpr double SUMMER_HIGH = 26.0;
}

std::set<int> default_winter_months();

// Seasonal band by calendar month. Any month outside the winter set,
// including values outside 1..12, gets the summer band.
ComfortBand comfort_band(int month, const std::set<int>& winter_months);

} // namespace hvacpilot
