#include "hvacpilot/policy/ActionQuantizer.hpp"

#include <cmath>
#include <cstddef>

namespace hvacpilot {

namespace {

double sq(double x) noexcept { return x * x; }

double distance(const ActionSetting& a, const ActionSetting& b) noexcept {
    return std::sqrt(sq(a.heating_sp - b.heating_sp) +
                     sq(a.cooling_sp - b.cooling_sp) +
                     sq(a.fan - b.fan) +
                     sq(a.wf_speed - b.wf_speed));
}

double distance(const TempPair& a, const TempPair& b) noexcept {
    return std::sqrt(sq(a.heating_sp - b.heating_sp) +
                     sq(a.cooling_sp - b.cooling_sp));
}

double distance(double a, double b) noexcept {
    return std::fabs(a - b);
}

// Stable argmin: strict < keeps the first of equal candidates.
template <typename Table, typename Point>
int argmin_distance(const Table& table, const Point& desired) noexcept {
    int best = 0;
    double best_dist = distance(table[0], desired);
    for (std::size_t i = 1; i < table.size(); ++i) {
        const double d = distance(table[i], desired);
        if (d < best_dist) {
            best_dist = d;
            best = static_cast<int>(i);
        }
    }
    return best;
}

} // namespace

int nearest_action(const ActionSetting& desired) noexcept {
    return argmin_distance(ACTION_TABLE, desired);
}

int nearest_temp_pair(const TempPair& desired) noexcept {
    return argmin_distance(TEMP_PAIRS, desired);
}

int nearest_fan_speed(double desired) noexcept {
    return argmin_distance(FAN_SPEEDS, desired);
}

} // namespace hvacpilot
