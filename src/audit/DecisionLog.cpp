#include "hvacpilot/audit/DecisionLog.hpp"

#include <iostream>

namespace hvacpilot {

using json = nlohmann::json;

namespace {

json setting_json(const ActionSetting& s) {
    return json::array({s.heating_sp, s.cooling_sp, s.fan, s.wf_speed});
}

const char* direction_str(TempDirection d) {
    switch (d) {
        case TempDirection::IN_BAND:  return "in_band";
        case TempDirection::TOO_HOT:  return "too_hot";
        case TempDirection::TOO_COLD: return "too_cold";
    }
    return "unknown";
}

} // namespace

DecisionLog::DecisionLog(const Config& config) : config_(config) {
    file_.open(config_.path, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        std::cerr << "[DECISIONLOG] ERROR: cannot open " << config_.path << "\n";
    }
}

DecisionLog::~DecisionLog() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

json DecisionLog::to_json(int step, const Observation& obs,
                          const PolicyDecision& d, double reward) {
    json j;
    j["step"] = step;
    j["month"] = obs.month();
    j["air_temperature"] = obs.air_temperature();
    j["air_co2"] = obs.air_co2();
    j["band"] = json::array({d.band.low, d.band.high});
    j["direction"] = direction_str(d.direction);
    j["active"] = d.climate_active;
    j["temp_patience"] = d.patience.temp_patience;
    j["co2_patience"] = d.patience.co2_patience;
    j["base"] = setting_json(d.base);
    if (d.temp_index >= 0) {
        j["base_temp_index"] = d.base_temp_index;
        j["base_fan_index"] = d.base_fan_index;
        j["temp_index"] = d.temp_index;
        j["fan_index"] = d.fan_index;
    }
    j["desired"] = setting_json(d.desired);
    j["action"] = d.action;
    j["reward"] = reward;
    if (d.invariant_violated) {
        j["invariant_violated"] = true;
    }
    return j;
}

void DecisionLog::log(int step, const Observation& obs, const PolicyDecision& d, double reward) {
    if (!file_.is_open()) {
        if (!warned_closed_) {
            std::cerr << "[DECISIONLOG] WARN: log " << config_.path
                      << " not open, dropping records\n";
            warned_closed_ = true;
        }
        return;
    }

    const json j = to_json(step, obs, d, reward);
    file_ << j.dump() << "\n";
    file_.flush();
    ++written_;

    if (config_.console_echo) {
        std::cout << "[DECISIONLOG] " << j.dump() << "\n";
    }
}

} // namespace hvacpilot
