// ═══════════════════════════════════════════════════════════════════════════════
// include/hvacpilot/policy/PatienceTracker.hpp
// ═══════════════════════════════════════════════════════════════════════════════
// PURPOSE: "The longer it's bad, the harder we push"
//
// Two counters of consecutive out-of-bounds steps:
//   temp_patience - air temperature outside the comfort band
//   co2_patience  - CO2 above 800 ppm
// Each bumps by one per triggering step and drops to zero the first step the
// condition clears. The counters bias the quantized setpoint index:
//   too hot   -> temp index moves down (cooler), never below 1
//   too cold  -> temp index moves up (warmer), capped at the last pair
//   CO2 high  -> fan index only ever moves up
//
// The caller owns the counters and threads them from one decision to the next.
// ═══════════════════════════════════════════════════════════════════════════════
#pragma once

#include <algorithm>
#include <cstdint>

namespace hvacpilot {

struct PatienceState {
    int temp_patience = 0;
    int co2_patience = 0;

    bool operator==(const PatienceState& o) const noexcept {
        return temp_patience == o.temp_patience && co2_patience == o.co2_patience;
    }
    bool operator!=(const PatienceState& o) const noexcept { return !(*this == o); }
};

enum class TempDirection : uint8_t {
    IN_BAND = 0,
    TOO_HOT = 1,
    TOO_COLD = 2
};

class PatienceTracker {
public:
    // threshold: consecutive steps per escalation unit. Values below 1 are
    // treated as 1; PolicyConfig::validate() rejects them earlier.
    explicit PatienceTracker(int threshold = 1) : threshold_(std::max(threshold, 1)) {}

    [[nodiscard]] PatienceState update(const PatienceState& prev,
                                       bool temp_out_of_band,
                                       bool co2_elevated) const noexcept;

    [[nodiscard]] int residual(int patience) const noexcept { return patience / threshold_; }

    // Escalated index into TEMP_PAIRS. Inactive climate control always maps to
    // the off-like pair regardless of patience.
    [[nodiscard]] int escalate_temp_index(int base_index,
                                          int temp_patience,
                                          bool climate_active,
                                          TempDirection dir) const noexcept;

    // Escalated index into FAN_SPEEDS. Monotonic upward.
    [[nodiscard]] int escalate_fan_index(int base_index, int co2_patience) const noexcept;

    int threshold() const noexcept { return threshold_; }

private:
    int threshold_;
};

} // namespace hvacpilot
