#pragma once

#include <array>
#include <iosfwd>

#include "hvacpilot/policy/ActionTable.hpp"
#include "hvacpilot/policy/PatienceTracker.hpp"
#include "hvacpilot/policy/RuleBasedPolicy.hpp"
#include "hvacpilot/sim/Environment.hpp"

namespace hvacpilot {

class DecisionLog;

struct EpisodeSummary {
    int steps{0};
    int episodes{0};  // episodes touched, including the unfinished last one
    int resets{0};    // resets forced by terminated/truncated
    double total_reward{0.0};
    double mean_reward{0.0};
    std::array<int, Actions::ACTION_COUNT> action_counts{};
};

// ---------------------------------------------------------------------------
// Drives a policy against an environment for a fixed number of steps.
//
// Owns the patience counters: they are threaded from one decision to the
// next and zeroed whenever the environment is reset. Rewards accumulate over
// the whole run, across episode boundaries.
// ---------------------------------------------------------------------------
class EpisodeRunner {
public:
    struct Options {
        int steps = 100;
        bool echo = true;           // per-step console lines
        bool print_mapping = true;  // dump the action mapping before running
    };

    EpisodeRunner(Environment& env, const RuleBasedPolicy& policy, const Options& opts,
                  std::ostream& out);

    // Optional audit trail; not owned.
    void set_decision_log(DecisionLog* log) { log_ = log; }

    EpisodeSummary run();

    // "Action i: [h, c, f, w]" for every action id the environment exposes.
    void print_action_mapping() const;

private:
    Environment& env_;
    const RuleBasedPolicy& policy_;
    Options opts_;
    std::ostream& out_;
    DecisionLog* log_{nullptr};
};

} // namespace hvacpilot
