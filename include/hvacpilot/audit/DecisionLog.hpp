// ═══════════════════════════════════════════════════════════════════════════════
// include/hvacpilot/audit/DecisionLog.hpp
// ═══════════════════════════════════════════════════════════════════════════════
// PURPOSE: Per-step audit trail of policy decisions (JSON lines)
//
// One object per step: inputs the policy read, comfort band, activation,
// patience counters, per-axis indices, desired vector, chosen action, reward.
// Enough to reconstruct why each action was taken without re-running.
// ═══════════════════════════════════════════════════════════════════════════════
#pragma once

#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "hvacpilot/core/Observation.hpp"
#include "hvacpilot/policy/RuleBasedPolicy.hpp"

namespace hvacpilot {

class DecisionLog {
public:
    struct Config {
        std::string path = "decisions.jsonl";
        bool console_echo = false;
    };

    explicit DecisionLog(const Config& config);
    ~DecisionLog();

    DecisionLog(const DecisionLog&) = delete;
    DecisionLog& operator=(const DecisionLog&) = delete;

    bool is_open() const { return file_.is_open(); }

    void log(int step, const Observation& obs, const PolicyDecision& d, double reward);

    size_t records_written() const { return written_; }

    static nlohmann::json to_json(int step, const Observation& obs,
                                  const PolicyDecision& d, double reward);

private:
    Config config_;
    std::ofstream file_;
    size_t written_{0};
    bool warned_closed_{false};
};

} // namespace hvacpilot
