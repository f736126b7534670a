#pragma once

#include "hvacpilot/config/PolicyConfig.hpp"
#include "hvacpilot/core/Observation.hpp"
#include "hvacpilot/policy/ActionTable.hpp"
#include "hvacpilot/policy/ActivationRule.hpp"
#include "hvacpilot/policy/ComfortBand.hpp"
#include "hvacpilot/policy/PatienceTracker.hpp"

namespace hvacpilot {

// Everything one decision computed, for callers that log or test the
// intermediate steps. Only `action` and `patience` feed the next step.
struct PolicyDecision {
    int action = Actions::ACTION_FALLBACK;
    PatienceState patience;

    ComfortBand band;
    bool climate_active = false;
    TempDirection direction = TempDirection::IN_BAND;

    ActionSetting base;     // rule output before escalation
    int base_temp_index = -1;
    int base_fan_index = -1;
    int temp_index = -1;    // after escalation; -1 when escalation is off
    int fan_index = -1;
    ActionSetting desired;  // vector handed to the 40-entry quantizer

    bool invariant_violated = false;
};

// ---------------------------------------------------------------------------
// Rule-based HVAC policy.
//
// Per decision:
//   1. comfort band from month
//   2. patience update (escalation on): +1 while out of band / CO2 > 800,
//      0 otherwise
//   3. climate-active decision (strict or margin rule)
//   4. window-fan speed from CO2
//   5. base setpoints: off-like (5, 50, fan 0) when inactive, otherwise
//      floor(band midpoint) clamped to the table range, fan 1
//   6. escalation on: quantize per axis, shift indices by patience, read back
//   7. nearest entry of the 40-action table
//   8. clamp to [0, 39]; a clamp here means a broken table and is logged
//
// The policy holds only immutable config; decide() is const and reentrant.
// Patience state lives with the caller.
// ---------------------------------------------------------------------------
class RuleBasedPolicy {
public:
    // Throws std::invalid_argument when config.validate() fails.
    explicit RuleBasedPolicy(const PolicyConfig& config = PolicyConfig{});

    PolicyDecision decide(const Observation& obs, const PatienceState& prev) const;

    // Stateless form. With escalation on it behaves like the first step of
    // an episode (both counters start at zero).
    int act(const Observation& obs) const;

    const PolicyConfig& config() const { return config_; }

private:
    ActionSetting base_setting(const ComfortBand& band, bool active, double wf_speed) const;
    void apply_escalation(PolicyDecision& d) const;

    PolicyConfig config_;
    ActivationRule activation_;
    PatienceTracker patience_;
};

} // namespace hvacpilot
