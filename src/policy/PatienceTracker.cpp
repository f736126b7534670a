#include "hvacpilot/policy/PatienceTracker.hpp"
#include "hvacpilot/policy/ActionTable.hpp"

#include <algorithm>
#include <limits>

namespace hvacpilot {

namespace {

// Counters saturate instead of wrapping negative.
int bump(int patience) noexcept {
    return patience < std::numeric_limits<int>::max() ? patience + 1 : patience;
}

} // namespace

PatienceState PatienceTracker::update(const PatienceState& prev,
                                      bool temp_out_of_band,
                                      bool co2_elevated) const noexcept {
    PatienceState next;
    next.temp_patience = temp_out_of_band ? bump(prev.temp_patience) : 0;
    next.co2_patience = co2_elevated ? bump(prev.co2_patience) : 0;
    return next;
}

int PatienceTracker::escalate_temp_index(int base_index,
                                         int temp_patience,
                                         bool climate_active,
                                         TempDirection dir) const noexcept {
    int idx = base_index;
    // No step can move the index further than the table is long.
    const int steps = std::min(residual(temp_patience), Actions::TEMP_LAST_INDEX);

    if (!climate_active) {
        idx = Actions::TEMP_OFF_INDEX;
    } else if (dir == TempDirection::TOO_HOT) {
        // Actively cooling never falls back to the off-like pair.
        idx = std::max(base_index - steps, 1);
    } else if (dir == TempDirection::TOO_COLD) {
        idx = std::min(base_index + steps, Actions::TEMP_LAST_INDEX);
    }

    return std::clamp(idx, 0, Actions::TEMP_LAST_INDEX);
}

int PatienceTracker::escalate_fan_index(int base_index, int co2_patience) const noexcept {
    const int steps = std::min(residual(co2_patience), Actions::FAN_LAST_INDEX);
    const int idx = std::min(base_index + steps, Actions::FAN_LAST_INDEX);
    return std::clamp(idx, 0, Actions::FAN_LAST_INDEX);
}

} // namespace hvacpilot
