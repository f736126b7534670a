/*
 * INI loading, policy/runner config mapping and observation validation.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "hvacpilot/config/ConfigLoader.hpp"
#include "hvacpilot/config/PolicyConfig.hpp"
#include "hvacpilot/core/Observation.hpp"

using namespace hvacpilot;

namespace {

ConfigLoader load_text(const std::string& text) {
    ConfigLoader cfg;
    std::istringstream in(text);
    cfg.loadFromStream(in);
    return cfg;
}

} // namespace

TEST(ConfigLoader, ParsesSectionsCommentsAndWhitespace)
{
    const ConfigLoader cfg = load_text(
        "# comment\n"
        "; another\n"
        "[policy]\n"
        "  activation =  margin  \n"
        "comfort_margin=0.75\n"
        "\n"
        "[ runner ]\n"
        "steps = 12\n"
        "echo = off\n");

    EXPECT_TRUE(cfg.has("policy", "activation"));
    EXPECT_EQ("margin", cfg.get("policy", "activation"));
    EXPECT_DOUBLE_EQ(0.75, cfg.getDouble("policy", "comfort_margin", 0.0));
    EXPECT_EQ(12, cfg.getInt("runner", "steps", 0));
    EXPECT_FALSE(cfg.getBool("runner", "echo", true));
    EXPECT_EQ("fallback", cfg.get("runner", "missing", "fallback"));
    EXPECT_FALSE(cfg.has("policy", "steps"));
}

TEST(ConfigLoader, BadNumbersFallBackToDefault)
{
    const ConfigLoader cfg = load_text(
        "[x]\n"
        "i = 12abc\n"
        "d = warm\n"
        "b = maybe\n");
    EXPECT_EQ(7, cfg.getInt("x", "i", 7));
    EXPECT_DOUBLE_EQ(1.5, cfg.getDouble("x", "d", 1.5));
    EXPECT_TRUE(cfg.getBool("x", "b", true));
}

TEST(ConfigLoader, EmptyStreamLoadsNothing)
{
    ConfigLoader cfg;
    std::istringstream in("# only a comment\n");
    EXPECT_FALSE(cfg.loadFromStream(in));
}

TEST(ConfigLoader, MissingFileReturnsFalse)
{
    ConfigLoader cfg;
    EXPECT_FALSE(cfg.load("hvacpilot_no_such_config_file.ini"));
}

TEST(PolicyConfig, DefaultsWhenSectionAbsent)
{
    const PolicyConfig pc = PolicyConfig::from_loader(load_text("[other]\nk = v\n"));
    EXPECT_EQ((std::set<int>{1, 2, 3, 11, 12}), pc.winter_months);
    EXPECT_EQ(ActivationMode::STRICT, pc.activation);
    EXPECT_DOUBLE_EQ(0.5, pc.comfort_margin);
    EXPECT_TRUE(pc.escalation);
    EXPECT_EQ(1, pc.escalation_threshold);
    EXPECT_NO_THROW(pc.validate());
}

TEST(PolicyConfig, ReadsAllKnobs)
{
    const PolicyConfig pc = PolicyConfig::from_loader(load_text(
        "[policy]\n"
        "winter_months = 6, 7,8\n"
        "activation = Margin\n"
        "comfort_margin = 1.25\n"
        "escalation = false\n"
        "escalation_threshold = 3\n"));
    EXPECT_EQ((std::set<int>{6, 7, 8}), pc.winter_months);
    EXPECT_EQ(ActivationMode::MARGIN, pc.activation);
    EXPECT_DOUBLE_EQ(1.25, pc.comfort_margin);
    EXPECT_FALSE(pc.escalation);
    EXPECT_EQ(3, pc.escalation_threshold);
    EXPECT_EQ("winter_months=6,7,8 activation=margin margin=1.25 escalation=off", pc.describe());
}

TEST(PolicyConfig, InvalidValuesReplacedByDefaults)
{
    const PolicyConfig pc = PolicyConfig::from_loader(load_text(
        "[policy]\n"
        "winter_months = 1,14\n"
        "activation = sometimes\n"
        "comfort_margin = -2\n"
        "escalation_threshold = 0\n"));
    EXPECT_EQ(default_winter_months(), pc.winter_months);
    EXPECT_EQ(ActivationMode::STRICT, pc.activation);
    EXPECT_DOUBLE_EQ(0.5, pc.comfort_margin);
    EXPECT_EQ(1, pc.escalation_threshold);
    EXPECT_NO_THROW(pc.validate());
}

TEST(PolicyConfig, ValidateThrows)
{
    PolicyConfig pc;
    pc.winter_months = {0};
    EXPECT_THROW(pc.validate(), std::invalid_argument);

    pc = PolicyConfig{};
    pc.comfort_margin = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(pc.validate(), std::invalid_argument);

    pc = PolicyConfig{};
    pc.escalation_threshold = -1;
    EXPECT_THROW(pc.validate(), std::invalid_argument);
}

TEST(PolicyConfig, ParseMonthList)
{
    std::set<int> out{99};
    EXPECT_TRUE(parse_month_list("12, 1 ,2", out));
    EXPECT_EQ((std::set<int>{1, 2, 12}), out);

    std::set<int> untouched{5};
    EXPECT_FALSE(parse_month_list("", untouched));
    EXPECT_FALSE(parse_month_list("1,,2", untouched));
    EXPECT_FALSE(parse_month_list("jan", untouched));
    EXPECT_FALSE(parse_month_list("1.5", untouched));
    EXPECT_EQ(std::set<int>{5}, untouched);
}

TEST(RunnerConfig, ReadsRunnerSection)
{
    const RunnerConfig rc = RunnerConfig::from_loader(load_text(
        "[runner]\n"
        "steps = 250\n"
        "echo = no\n"
        "decision_log = out/decisions.jsonl\n"));
    EXPECT_EQ(250, rc.steps);
    EXPECT_FALSE(rc.echo);
    EXPECT_EQ("out/decisions.jsonl", rc.decision_log);

    const RunnerConfig bad = RunnerConfig::from_loader(load_text("[runner]\nsteps = -3\n"));
    EXPECT_EQ(100, bad.steps);
    EXPECT_TRUE(bad.echo);
    EXPECT_TRUE(bad.decision_log.empty());
}

TEST(Observation, FromValuesValidatesLengthAndFiniteness)
{
    std::vector<double> v(Observation::SIZE, 1.0);
    v[Observation::MONTH] = 7.9;
    v[Observation::AIR_TEMPERATURE] = 26.4;
    v[Observation::AIR_CO2] = 910.0;

    const Observation obs = Observation::from_values(v);
    EXPECT_EQ(7, obs.month());
    EXPECT_DOUBLE_EQ(26.4, obs.air_temperature());
    EXPECT_DOUBLE_EQ(910.0, obs.air_co2());
    EXPECT_DOUBLE_EQ(1.0, obs[Observation::PPD]);

    std::vector<double> short_v(14, 0.0);
    EXPECT_THROW(Observation::from_values(short_v), std::invalid_argument);

    std::vector<double> long_v(16, 0.0);
    EXPECT_THROW(Observation::from_values(long_v), std::invalid_argument);

    v[Observation::AIR_CO2] = std::numeric_limits<double>::infinity();
    EXPECT_THROW(Observation::from_values(v), std::invalid_argument);

    v[Observation::AIR_CO2] = std::nan("");
    EXPECT_THROW(Observation::from_values(v), std::invalid_argument);
}

// A finite but huge month passes validation and must still read as no season.
TEST(Observation, MonthOutsideIntRangeReadsAsZero)
{
    std::vector<double> v(Observation::SIZE, 1.0);
    v[Observation::MONTH] = 1e10;
    EXPECT_EQ(0, Observation::from_values(v).month());

    v[Observation::MONTH] = -1e10;
    EXPECT_EQ(0, Observation::from_values(v).month());

    v[Observation::MONTH] = -3.7;
    EXPECT_EQ(-3, Observation::from_values(v).month());
}
