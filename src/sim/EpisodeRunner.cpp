#include "hvacpilot/sim/EpisodeRunner.hpp"
#include "hvacpilot/audit/DecisionLog.hpp"

#include <iomanip>
#include <ios>
#include <ostream>
#include <stdexcept>

namespace hvacpilot {

EpisodeRunner::EpisodeRunner(Environment& env, const RuleBasedPolicy& policy,
                             const Options& opts, std::ostream& out)
    : env_(env), policy_(policy), opts_(opts), out_(out) {}

void EpisodeRunner::print_action_mapping() const {
    for (int a = 0; a < env_.action_count(); ++a) {
        try {
            out_ << "Action " << a << ": " << format_action(env_.action_mapping(a)) << "\n";
        } catch (const std::out_of_range&) {
            out_ << "Action " << a << ": [ERROR - not defined in the mapping]\n";
        }
    }
    out_ << "-----------------------\n";
}

EpisodeSummary EpisodeRunner::run() {
    EpisodeSummary summary;

    if (opts_.print_mapping) {
        print_action_mapping();
    }

    out_ << "--- Resetting environment '" << env_.name() << "'... ---\n";
    Observation obs = env_.reset().obs;
    PatienceState patience;
    summary.episodes = 1;

    // Number formatting below must not leak into the caller's stream.
    const std::ios::fmtflags saved_flags = out_.flags();
    const std::streamsize saved_precision = out_.precision();

    out_ << "--- Starting simulation loop (" << opts_.steps << " steps) ---\n";
    for (int i = 0; i < opts_.steps; ++i) {
        const PolicyDecision d = policy_.decide(obs, patience);
        patience = d.patience;

        StepResult r = env_.step(d.action);

        summary.total_reward += r.reward;
        summary.steps++;
        summary.action_counts[static_cast<size_t>(d.action)]++;

        if (log_) {
            log_->log(i + 1, obs, d, r.reward);
        }

        if (opts_.echo) {
            out_ << "Step: " << (i + 1) << "/" << opts_.steps
                 << ", Reward: " << std::fixed << std::setprecision(4) << r.reward << "\n";
            out_.flags(saved_flags);
            out_.precision(saved_precision);
        }

        if (r.terminated || r.truncated) {
            out_ << "--- Episode finished at step " << (i + 1) << ", resetting... ---\n";
            obs = env_.reset().obs;
            patience = PatienceState{};
            summary.resets++;
            // A reset on the very last step opens no new episode.
            if (i + 1 < opts_.steps) summary.episodes++;
        } else {
            obs = r.obs;
        }
    }

    if (summary.steps > 0) {
        summary.mean_reward = summary.total_reward / summary.steps;
    }

    out_ << "\n--- EPISODE FINISHED ---\n";
    out_ << "Episode Mean reward: " << std::fixed << std::setprecision(4)
         << summary.mean_reward << "\n";
    out_ << "Episode Cumulative reward: " << std::setprecision(2)
         << summary.total_reward << "\n";
    out_.flags(saved_flags);
    out_.precision(saved_precision);
    out_ << "--------------------------\n";

    return summary;
}

} // namespace hvacpilot
