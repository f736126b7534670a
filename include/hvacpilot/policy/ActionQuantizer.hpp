#pragma once

#include "hvacpilot/policy/ActionTable.hpp"

namespace hvacpilot {

// ---------------------------------------------------------------------------
// Nearest-entry lookup against the fixed tables.
//
// Brute-force linear scan; the tables are tiny. Distance is Euclidean for
// the 4-D and 2-D tables and absolute difference for the fan speeds. Ties
// resolve to the lowest index. Always returns a valid index for finite input.
// ---------------------------------------------------------------------------
int nearest_action(const ActionSetting& desired) noexcept;
int nearest_temp_pair(const TempPair& desired) noexcept;
int nearest_fan_speed(double desired) noexcept;

} // namespace hvacpilot
