#pragma once

#include <istream>
#include <string>
#include <vector>

#include "hvacpilot/sim/Environment.hpp"

namespace hvacpilot {

// One line of a recorded trace.
struct TraceRecord {
    Observation obs;
    double reward{0.0};
    bool terminated{false};
    bool truncated{false};
    nlohmann::json info = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// Replays a recorded simulator run from a JSON-lines file:
//
//   {"obs": [15 numbers], "reward": -0.4, "terminated": false,
//    "truncated": false, "info": {...}}
//
// Only "obs" is required. The trace is open-loop: actions are validated and
// recorded but do not change what comes next. reset() starts from the record
// after the last terminal one, wrapping to the start at end of file. Running
// off the end of the trace reports truncated=true.
// ---------------------------------------------------------------------------
class TraceEnvironment : public Environment {
public:
    // Throws std::runtime_error if the file cannot be opened or is malformed.
    explicit TraceEnvironment(const std::string& path);

    // Parse from an already-open stream; `label` names it in error messages.
    TraceEnvironment(std::istream& in, const std::string& label);

    ResetResult reset() override;
    StepResult step(int action) override;

    int action_count() const override;
    ActionSetting action_mapping(int action) const override;
    std::string name() const override { return "trace:" + label_; }

    size_t size() const { return records_.size(); }
    size_t cursor() const { return cursor_; }
    const std::vector<int>& applied_actions() const { return applied_; }

    static TraceRecord parse_record(const std::string& line, size_t line_no);

private:
    void load(std::istream& in);

    std::string label_;
    std::vector<TraceRecord> records_;
    std::vector<int> applied_;
    size_t cursor_{0};
    bool started_{false};
    bool needs_wrap_{false};
};

} // namespace hvacpilot
