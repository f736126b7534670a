#pragma once

#include <set>
#include <string>

#include "hvacpilot/policy/ActivationRule.hpp"

namespace hvacpilot {

class ConfigLoader;

// ---------------------------------------------------------------------------
// Policy knobs. Defaults reproduce the escalating controller with strict
// activation. Setting escalation=false with activation=MARGIN gives the
// stateless margin controller.
//
// INI section [policy]:
//   winter_months        = 11,12,1,2,3
//   activation           = strict | margin
//   comfort_margin       = 0.5
//   escalation           = true
//   escalation_threshold = 1
// ---------------------------------------------------------------------------
struct PolicyConfig {
    std::set<int> winter_months{11, 12, 1, 2, 3};
    ActivationMode activation = ActivationMode::STRICT;
    double comfort_margin = 0.5;
    bool escalation = true;
    int escalation_threshold = 1;

    // Throws std::invalid_argument on a month outside 1..12, a negative or
    // non-finite margin, or a threshold below 1.
    void validate() const;

    // Reads [policy]. Never throws: bad values are reported on stderr and
    // replaced by the defaults above.
    static PolicyConfig from_loader(const ConfigLoader& cfg);

    std::string describe() const;
};

// [runner] section of the replay tool.
struct RunnerConfig {
    int steps = 100;
    bool echo = true;
    std::string decision_log;  // empty = no log

    static RunnerConfig from_loader(const ConfigLoader& cfg);
};

// "11, 12,1" -> {1, 11, 12}. Returns false on an empty list or a token that
// is not an integer.
bool parse_month_list(const std::string& text, std::set<int>& out);

} // namespace hvacpilot
