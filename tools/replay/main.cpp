#include "hvacpilot/audit/DecisionLog.hpp"
#include "hvacpilot/config/ConfigLoader.hpp"
#include "hvacpilot/config/PolicyConfig.hpp"
#include "hvacpilot/policy/RuleBasedPolicy.hpp"
#include "hvacpilot/sim/EpisodeRunner.hpp"
#include "hvacpilot/sim/TraceEnvironment.hpp"

#include <exception>
#include <iostream>
#include <memory>

using namespace hvacpilot;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: hvacpilot_replay <trace.jsonl> [config.ini]\n";
        return 1;
    }

    try {
        ConfigLoader& cfg = ConfigLoader::instance();
        if (argc >= 3) {
            if (!cfg.load(argv[2])) {
                return 1;
            }
            cfg.dump();
        }

        const PolicyConfig pc = PolicyConfig::from_loader(cfg);
        const RunnerConfig rc = RunnerConfig::from_loader(cfg);

        RuleBasedPolicy policy(pc);
        std::cout << "[REPLAY] Policy: " << pc.describe() << "\n";

        TraceEnvironment env(argv[1]);

        EpisodeRunner::Options opts;
        opts.steps = rc.steps;
        opts.echo = rc.echo;
        EpisodeRunner runner(env, policy, opts, std::cout);

        std::unique_ptr<DecisionLog> log;
        if (!rc.decision_log.empty()) {
            DecisionLog::Config lc;
            lc.path = rc.decision_log;
            log = std::make_unique<DecisionLog>(lc);
            if (!log->is_open()) {
                return 1;
            }
            runner.set_decision_log(log.get());
        }

        const EpisodeSummary summary = runner.run();
        env.close();

        std::cout << "[REPLAY] steps=" << summary.steps
                  << " episodes=" << summary.episodes
                  << " resets=" << summary.resets << "\n";
        for (size_t a = 0; a < summary.action_counts.size(); ++a) {
            if (summary.action_counts[a] > 0) {
                std::cout << "  action " << a << " "
                          << format_action(ACTION_TABLE[a]) << ": "
                          << summary.action_counts[a] << "\n";
            }
        }
        if (log) {
            std::cout << "[REPLAY] " << log->records_written()
                      << " decisions written to " << rc.decision_log << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[REPLAY] ERROR " << e.what() << "\n";
        return 1;
    }

    return 0;
}
