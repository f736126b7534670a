/*
 * Episode driver: reward accounting, resets and patience threading.
 */

#include <gtest/gtest.h>

#include <ios>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "hvacpilot/sim/EpisodeRunner.hpp"
#include "TestObservations.hpp"

using namespace hvacpilot;
using hvacpilot::test::make_obs;

namespace {

// Always reports the same observation; ends an episode every `episode_len`
// steps. Exposes one action id more than it can map.
class FakeEnvironment : public Environment {
public:
    FakeEnvironment(Observation obs, int episode_len, double reward)
        : obs_(obs), episode_len_(episode_len), reward_(reward) {}

    ResetResult reset() override {
        ++resets;
        since_reset_ = 0;
        return ResetResult{obs_, nlohmann::json::object()};
    }

    StepResult step(int action) override {
        actions.push_back(action);
        ++since_reset_;
        StepResult r;
        r.obs = obs_;
        r.reward = reward_;
        r.terminated = (since_reset_ >= episode_len_);
        return r;
    }

    int action_count() const override { return static_cast<int>(Actions::ACTION_COUNT) + 1; }

    ActionSetting action_mapping(int action) const override {
        if (!valid_action(action)) throw std::out_of_range("unmapped");
        return ACTION_TABLE[static_cast<size_t>(action)];
    }

    std::string name() const override { return "fake"; }

    std::vector<int> actions;
    int resets{0};

private:
    Observation obs_;
    int episode_len_;
    double reward_;
    int since_reset_{0};
};

} // namespace

TEST(EpisodeRunner, AccumulatesRewardAndResetsOnTermination)
{
    FakeEnvironment env(make_obs(7, 30.0, 400.0), 2, -1.0);
    PolicyConfig pc;
    pc.escalation = true;
    const RuleBasedPolicy policy(pc);

    EpisodeRunner::Options opts;
    opts.steps = 4;
    opts.print_mapping = false;
    std::ostringstream out;
    EpisodeRunner runner(env, policy, opts, out);

    const EpisodeSummary s = runner.run();

    EXPECT_EQ(4, s.steps);
    EXPECT_EQ(2, s.resets);
    EXPECT_EQ(2, s.episodes);
    EXPECT_DOUBLE_EQ(-4.0, s.total_reward);
    EXPECT_DOUBLE_EQ(-1.0, s.mean_reward);
    EXPECT_EQ(3, env.resets);  // initial + two terminations

    // Patience restarts with every episode: (23,24) then (22,23), twice.
    const std::vector<int> expected{8, 4, 8, 4};
    EXPECT_EQ(expected, env.actions);
    EXPECT_EQ(2, s.action_counts[8]);
    EXPECT_EQ(2, s.action_counts[4]);

    const std::string text = out.str();
    EXPECT_NE(std::string::npos, text.find("Step: 1/4, Reward: -1.0000"));
    EXPECT_NE(std::string::npos, text.find("--- Episode finished at step 2, resetting... ---"));
    EXPECT_NE(std::string::npos, text.find("Episode Mean reward: -1.0000"));
    EXPECT_NE(std::string::npos, text.find("Episode Cumulative reward: -4.00"));
    EXPECT_EQ(std::string::npos, text.find("Action 0:"));
}

TEST(EpisodeRunner, PatienceKeepsGrowingWithoutTermination)
{
    FakeEnvironment env(make_obs(7, 30.0, 400.0), 1000, 0.0);
    const RuleBasedPolicy policy(PolicyConfig{});

    EpisodeRunner::Options opts;
    opts.steps = 5;
    opts.echo = false;
    opts.print_mapping = false;
    std::ostringstream out;
    EpisodeRunner runner(env, policy, opts, out);

    const EpisodeSummary s = runner.run();
    EXPECT_EQ(0, s.resets);
    EXPECT_EQ(1, s.episodes);
    const std::vector<int> expected{8, 4, 0, 0, 0};
    EXPECT_EQ(expected, env.actions);
    EXPECT_EQ(std::string::npos, out.str().find("Step: 1/5"));
}

TEST(EpisodeRunner, StatelessPolicyRepeatsSameAction)
{
    FakeEnvironment env(make_obs(7, 30.0, 1300.0), 3, 0.5);
    PolicyConfig pc;
    pc.escalation = false;
    pc.activation = ActivationMode::MARGIN;
    const RuleBasedPolicy policy(pc);

    EpisodeRunner::Options opts;
    opts.steps = 6;
    opts.echo = false;
    opts.print_mapping = false;
    std::ostringstream out;
    EpisodeRunner runner(env, policy, opts, out);

    const EpisodeSummary s = runner.run();
    EXPECT_EQ(6, s.action_counts[15]);
    EXPECT_DOUBLE_EQ(3.0, s.total_reward);
    EXPECT_EQ(2, s.resets);
    EXPECT_EQ(2, s.episodes);
}

TEST(EpisodeRunner, PrintsActionMappingAndUnmappedIds)
{
    FakeEnvironment env(make_obs(6, 24.5, 400.0), 10, 0.0);
    const RuleBasedPolicy policy(PolicyConfig{});

    EpisodeRunner::Options opts;
    std::ostringstream out;
    EpisodeRunner runner(env, policy, opts, out);
    runner.print_action_mapping();

    const std::string text = out.str();
    EXPECT_NE(std::string::npos, text.find("Action 0: [21, 22, 1, 0]"));
    EXPECT_NE(std::string::npos, text.find("Action 39: [5, 50, 0, 1]"));
    EXPECT_NE(std::string::npos, text.find("Action 40: [ERROR - not defined in the mapping]"));
}

TEST(EpisodeRunner, LeavesCallerStreamFormatting)
{
    FakeEnvironment env(make_obs(7, 30.0, 400.0), 2, -1.0);
    const RuleBasedPolicy policy(PolicyConfig{});

    EpisodeRunner::Options opts;
    opts.steps = 3;
    opts.print_mapping = false;
    std::ostringstream out;
    out.precision(6);
    const std::ios::fmtflags before = out.flags();
    EpisodeRunner runner(env, policy, opts, out);
    runner.run();

    EXPECT_EQ(6, out.precision());
    EXPECT_EQ(before, out.flags());

    out.str("");
    out << 0.123456;
    EXPECT_EQ("0.123456", out.str());
}
