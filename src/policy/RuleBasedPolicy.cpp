#include "hvacpilot/policy/RuleBasedPolicy.hpp"
#include "hvacpilot/policy/ActionQuantizer.hpp"
#include "hvacpilot/policy/VentilationRule.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace hvacpilot {

RuleBasedPolicy::RuleBasedPolicy(const PolicyConfig& config)
    : config_(config),
      activation_(config.activation, config.comfort_margin),
      patience_(config.escalation_threshold) {
    config_.validate();
}

ActionSetting RuleBasedPolicy::base_setting(const ComfortBand& band,
                                            bool active,
                                            double wf_speed) const {
    ActionSetting s;
    s.wf_speed = wf_speed;

    if (!active) {
        s.heating_sp = Actions::OFF_HEATING_SP;
        s.cooling_sp = Actions::OFF_COOLING_SP;
        s.fan = 0.0;
        return s;
    }

    s.heating_sp = std::clamp(std::floor(band.midpoint()),
                              Actions::MIN_HEATING_SP, Actions::MAX_HEATING_SP);
    s.cooling_sp = std::clamp(s.heating_sp + 1.0,
                              Actions::MIN_COOLING_SP, Actions::MAX_COOLING_SP);
    s.fan = 1.0;
    return s;
}

void RuleBasedPolicy::apply_escalation(PolicyDecision& d) const {
    d.base_temp_index = nearest_temp_pair({d.base.heating_sp, d.base.cooling_sp});
    d.base_fan_index = nearest_fan_speed(d.base.wf_speed);

    d.temp_index = patience_.escalate_temp_index(d.base_temp_index,
                                                 d.patience.temp_patience,
                                                 d.climate_active,
                                                 d.direction);
    d.fan_index = patience_.escalate_fan_index(d.base_fan_index, d.patience.co2_patience);

    const TempPair& tp = TEMP_PAIRS[static_cast<size_t>(d.temp_index)];
    d.desired.heating_sp = tp.heating_sp;
    d.desired.cooling_sp = tp.cooling_sp;
    d.desired.fan = d.base.fan;
    d.desired.wf_speed = FAN_SPEEDS[static_cast<size_t>(d.fan_index)];
}

PolicyDecision RuleBasedPolicy::decide(const Observation& obs, const PatienceState& prev) const {
    PolicyDecision d;

    const double air_temp = obs.air_temperature();
    const double air_co2 = obs.air_co2();

    // 1) Comfort range
    d.band = comfort_band(obs.month(), config_.winter_months);

    if (d.band.above(air_temp)) {
        d.direction = TempDirection::TOO_HOT;
    } else if (d.band.below(air_temp)) {
        d.direction = TempDirection::TOO_COLD;
    }

    // 2) Patience counters
    if (config_.escalation) {
        d.patience = patience_.update(prev,
                                      d.direction != TempDirection::IN_BAND,
                                      air_co2 > Ventilation::CO2_PATIENCE_PPM);
    } else {
        d.patience = prev;
    }

    // 3-5) Active decision, window fan, base setpoints
    d.climate_active = activation_.active(air_temp, d.band);
    d.base = base_setting(d.band, d.climate_active, window_fan_speed(air_co2));

    // 6) Per-axis escalation
    if (config_.escalation) {
        apply_escalation(d);
    } else {
        d.desired = d.base;
    }

    // 7) Closest of the 40 discrete actions
    d.action = nearest_action(d.desired);

    // 8) Never hand out an undefined action
    if (!valid_action(d.action)) {
        std::cerr << "[POLICY] INVARIANT: quantizer returned action " << d.action
                  << " for desired " << format_action(d.desired)
                  << ", forcing " << Actions::ACTION_FALLBACK << "\n";
        d.action = Actions::ACTION_FALLBACK;
        d.invariant_violated = true;
    }

    return d;
}

int RuleBasedPolicy::act(const Observation& obs) const {
    return decide(obs, PatienceState{}).action;
}

} // namespace hvacpilot
