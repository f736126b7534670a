// ═══════════════════════════════════════════════════════════════════════════════
// include/hvacpilot/policy/ActionTable.hpp
// ═══════════════════════════════════════════════════════════════════════════════
// PURPOSE: Fixed discrete actuator tables shared by every policy decision
//
// ACTION_TABLE   - 40 (heating, cooling, fan, window-fan) settings. The index
//                  of an entry is the action id handed to the environment.
// TEMP_PAIRS     - 10 (heating, cooling) pairs used for escalation arithmetic.
//                  Index 0 is the off-like pair.
// FAN_SPEEDS     - 4 window-fan speeds.
//
// INVARIANT: tables never change at runtime. Indices 0..39 are the only
// legal action ids; ACTION_FALLBACK (39) is the clamp target.
// ═══════════════════════════════════════════════════════════════════════════════
#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace hvacpilot {

// Continuous actuator vector in table order.
struct ActionSetting {
    double heating_sp{0.0};
    double cooling_sp{0.0};
    double fan{0.0};
    double wf_speed{0.0};
};

struct TempPair {
    double heating_sp{0.0};
    double cooling_sp{0.0};
};

namespace Actions {
    constexpr std::size_t ACTION_COUNT = 40;
    constexpr std::size_t TEMP_PAIR_COUNT = 10;
    constexpr std::size_t FAN_SPEED_COUNT = 4;

    constexpr int ACTION_FALLBACK = static_cast<int>(ACTION_COUNT) - 1;
    constexpr int TEMP_OFF_INDEX = 0;
    constexpr int TEMP_LAST_INDEX = static_cast<int>(TEMP_PAIR_COUNT) - 1;
    constexpr int FAN_LAST_INDEX = static_cast<int>(FAN_SPEED_COUNT) - 1;

    // Off-like setpoints: the environment treats them as "HVAC idle".
    constexpr double OFF_HEATING_SP = 5.0;
    constexpr double OFF_COOLING_SP = 50.0;

    // Active setpoint range covered by the table.
    constexpr double MIN_HEATING_SP = 21.0;
    constexpr double MAX_HEATING_SP = 29.0;
    constexpr double MIN_COOLING_SP = 22.0;
    constexpr double MAX_COOLING_SP = 30.0;
}

extern const std::array<ActionSetting, Actions::ACTION_COUNT> ACTION_TABLE;
extern const std::array<TempPair, Actions::TEMP_PAIR_COUNT> TEMP_PAIRS;
extern const std::array<double, Actions::FAN_SPEED_COUNT> FAN_SPEEDS;

inline bool valid_action(int action) noexcept {
    return action >= 0 && action < static_cast<int>(Actions::ACTION_COUNT);
}

// "[21, 22, 1, 0.5]" - same shape the environment prints for its mapping.
std::string format_action(const ActionSetting& a);

} // namespace hvacpilot
