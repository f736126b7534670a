#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "hvacpilot/core/Observation.hpp"
#include "hvacpilot/policy/ActionTable.hpp"

namespace hvacpilot {

struct ResetResult {
    Observation obs;
    nlohmann::json info = nlohmann::json::object();
};

struct StepResult {
    Observation obs;
    double reward{0.0};
    bool terminated{false};
    bool truncated{false};
    nlohmann::json info = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// Episodic environment the policy is run against. Physics, reward and
// episode boundaries all live on this side.
// ---------------------------------------------------------------------------
class Environment {
public:
    virtual ~Environment() = default;

    virtual ResetResult reset() = 0;

    // Throws std::out_of_range for an action the environment does not map.
    virtual StepResult step(int action) = 0;

    virtual int action_count() const = 0;

    // Actuator values behind a discrete action. Throws std::out_of_range.
    virtual ActionSetting action_mapping(int action) const = 0;

    virtual std::string name() const = 0;

    virtual void close() {}
};

} // namespace hvacpilot
