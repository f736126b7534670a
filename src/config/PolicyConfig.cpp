#include "hvacpilot/config/PolicyConfig.hpp"
#include "hvacpilot/config/ConfigLoader.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace hvacpilot {

bool parse_month_list(const std::string& text, std::set<int>& out) {
    std::set<int> months;
    std::stringstream ss(text);
    std::string token;

    while (std::getline(ss, token, ',')) {
        const size_t start = token.find_first_not_of(" \t");
        if (start == std::string::npos) return false;
        const size_t end = token.find_last_not_of(" \t");
        token = token.substr(start, end - start + 1);

        try {
            size_t used = 0;
            const int m = std::stoi(token, &used);
            if (used != token.size()) return false;
            months.insert(m);
        } catch (const std::exception&) {
            return false;
        }
    }

    if (months.empty()) return false;
    out = std::move(months);
    return true;
}

void PolicyConfig::validate() const {
    for (int m : winter_months) {
        if (m < 1 || m > 12) {
            throw std::invalid_argument("winter month out of range 1..12: " + std::to_string(m));
        }
    }
    if (!std::isfinite(comfort_margin) || comfort_margin < 0.0) {
        throw std::invalid_argument("comfort_margin must be a finite value >= 0");
    }
    if (escalation_threshold < 1) {
        throw std::invalid_argument("escalation_threshold must be >= 1, got " +
                                    std::to_string(escalation_threshold));
    }
}

PolicyConfig PolicyConfig::from_loader(const ConfigLoader& cfg) {
    PolicyConfig pc;

    if (cfg.has("policy", "winter_months")) {
        const std::string raw = cfg.get("policy", "winter_months");
        std::set<int> months;
        bool ok = parse_month_list(raw, months);
        for (int m : months) {
            if (m < 1 || m > 12) ok = false;
        }
        if (ok) {
            pc.winter_months = months;
        } else {
            std::cerr << "[CONFIG] WARN: policy.winter_months=" << raw
                      << " invalid, using 11,12,1,2,3\n";
        }
    }

    if (cfg.has("policy", "activation")) {
        const std::string raw = cfg.get("policy", "activation");
        if (!parse_activation_mode(raw, pc.activation)) {
            std::cerr << "[CONFIG] WARN: policy.activation=" << raw
                      << " unknown (strict|margin), using strict\n";
            pc.activation = ActivationMode::STRICT;
        }
    }

    const double margin = cfg.getDouble("policy", "comfort_margin", pc.comfort_margin);
    if (std::isfinite(margin) && margin >= 0.0) {
        pc.comfort_margin = margin;
    } else {
        std::cerr << "[CONFIG] WARN: policy.comfort_margin=" << margin
                  << " must be >= 0, using " << pc.comfort_margin << "\n";
    }

    pc.escalation = cfg.getBool("policy", "escalation", pc.escalation);

    const int threshold = cfg.getInt("policy", "escalation_threshold", pc.escalation_threshold);
    if (threshold >= 1) {
        pc.escalation_threshold = threshold;
    } else {
        std::cerr << "[CONFIG] WARN: policy.escalation_threshold=" << threshold
                  << " must be >= 1, using " << pc.escalation_threshold << "\n";
    }

    return pc;
}

std::string PolicyConfig::describe() const {
    std::ostringstream ss;
    ss << "winter_months=";
    bool first = true;
    for (int m : winter_months) {
        if (!first) ss << ",";
        ss << m;
        first = false;
    }
    ss << " activation=" << activation_mode_str(activation);
    if (activation == ActivationMode::MARGIN) {
        ss << " margin=" << comfort_margin;
    }
    ss << " escalation=" << (escalation ? "on" : "off");
    if (escalation) {
        ss << " threshold=" << escalation_threshold;
    }
    return ss.str();
}

RunnerConfig RunnerConfig::from_loader(const ConfigLoader& cfg) {
    RunnerConfig rc;

    const int steps = cfg.getInt("runner", "steps", rc.steps);
    if (steps > 0) {
        rc.steps = steps;
    } else {
        std::cerr << "[CONFIG] WARN: runner.steps=" << steps
                  << " must be > 0, using " << rc.steps << "\n";
    }

    rc.echo = cfg.getBool("runner", "echo", rc.echo);
    rc.decision_log = cfg.get("runner", "decision_log", rc.decision_log);
    return rc;
}

} // namespace hvacpilot
