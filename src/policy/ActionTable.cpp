#include "hvacpilot/policy/ActionTable.hpp"

#include <sstream>

namespace hvacpilot {

const std::array<ActionSetting, Actions::ACTION_COUNT> ACTION_TABLE = {{
    {21.0, 22.0, 1.0, 0.0},   // 0
    {21.0, 22.0, 1.0, 0.5},
    {21.0, 22.0, 1.0, 0.75},
    {21.0, 22.0, 1.0, 1.0},
    {22.0, 23.0, 1.0, 0.0},   // 4
    {22.0, 23.0, 1.0, 0.5},
    {22.0, 23.0, 1.0, 0.75},
    {22.0, 23.0, 1.0, 1.0},
    {23.0, 24.0, 1.0, 0.0},   // 8
    {23.0, 24.0, 1.0, 0.5},
    {23.0, 24.0, 1.0, 0.75},
    {23.0, 24.0, 1.0, 1.0},
    {24.0, 25.0, 1.0, 0.0},   // 12
    {24.0, 25.0, 1.0, 0.5},
    {24.0, 25.0, 1.0, 0.75},
    {24.0, 25.0, 1.0, 1.0},
    {25.0, 26.0, 1.0, 0.0},   // 16
    {25.0, 26.0, 1.0, 0.5},
    {25.0, 26.0, 1.0, 0.75},
    {25.0, 26.0, 1.0, 1.0},
    {26.0, 27.0, 1.0, 0.0},   // 20
    {26.0, 27.0, 1.0, 0.5},
    {26.0, 27.0, 1.0, 0.75},
    {26.0, 27.0, 1.0, 1.0},
    {27.0, 28.0, 1.0, 0.0},   // 24
    {27.0, 28.0, 1.0, 0.5},
    {27.0, 28.0, 1.0, 0.75},
    {27.0, 28.0, 1.0, 1.0},
    {28.0, 29.0, 1.0, 0.0},   // 28
    {28.0, 29.0, 1.0, 0.5},
    {28.0, 29.0, 1.0, 0.75},
    {28.0, 29.0, 1.0, 1.0},
    {29.0, 30.0, 1.0, 0.0},   // 32
    {29.0, 30.0, 1.0, 0.5},
    {29.0, 30.0, 1.0, 0.75},
    {29.0, 30.0, 1.0, 1.0},
    {5.0, 50.0, 0.0, 0.0},    // 36 off-like, WF off
    {5.0, 50.0, 0.0, 0.5},
    {5.0, 50.0, 0.0, 0.75},
    {5.0, 50.0, 0.0, 1.0},
}};

const std::array<TempPair, Actions::TEMP_PAIR_COUNT> TEMP_PAIRS = {{
    {5.0, 50.0},   // off-like
    {21.0, 22.0},
    {22.0, 23.0},
    {23.0, 24.0},
    {24.0, 25.0},
    {25.0, 26.0},
    {26.0, 27.0},
    {27.0, 28.0},
    {28.0, 29.0},
    {29.0, 30.0},
}};

const std::array<double, Actions::FAN_SPEED_COUNT> FAN_SPEEDS = {{
    0.0, 0.5, 0.75, 1.0
}};

std::string format_action(const ActionSetting& a) {
    std::ostringstream ss;
    ss << "[" << a.heating_sp
       << ", " << a.cooling_sp
       << ", " << a.fan
       << ", " << a.wf_speed << "]";
    return ss.str();
}

} // namespace hvacpilot
