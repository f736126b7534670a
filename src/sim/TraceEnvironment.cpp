#include "hvacpilot/sim/TraceEnvironment.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace hvacpilot {

using json = nlohmann::json;

TraceEnvironment::TraceEnvironment(const std::string& path) : label_(path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open trace " + path);
    }
    load(in);
}

TraceEnvironment::TraceEnvironment(std::istream& in, const std::string& label) : label_(label) {
    load(in);
}

TraceRecord TraceEnvironment::parse_record(const std::string& line, size_t line_no) {
    const std::string where = "trace line " + std::to_string(line_no) + ": ";

    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(where + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error(where + "expected a JSON object");
    }
    if (!j.contains("obs") || !j["obs"].is_array()) {
        throw std::runtime_error(where + "missing \"obs\" array");
    }

    TraceRecord rec;
    try {
        rec.obs = Observation::from_values(j["obs"].get<std::vector<double>>());
        rec.reward = j.value("reward", 0.0);
        rec.terminated = j.value("terminated", false);
        rec.truncated = j.value("truncated", false);
    } catch (const json::exception& e) {
        throw std::runtime_error(where + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(where + e.what());
    }

    if (j.contains("info")) {
        if (!j["info"].is_object()) {
            throw std::runtime_error(where + "\"info\" must be an object");
        }
        rec.info = j["info"];
    }
    return rec;
}

void TraceEnvironment::load(std::istream& in) {
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;
        records_.push_back(parse_record(line, line_no));
    }

    if (records_.empty()) {
        throw std::runtime_error("trace " + label_ + " has no records");
    }

    std::cout << "[TRACE] Loaded " << records_.size() << " records from " << label_ << "\n";
}

ResetResult TraceEnvironment::reset() {
    if (!started_ || needs_wrap_ || cursor_ + 1 >= records_.size()) {
        cursor_ = 0;
    } else {
        ++cursor_;
    }
    started_ = true;
    needs_wrap_ = false;

    const TraceRecord& rec = records_[cursor_];
    return ResetResult{rec.obs, rec.info};
}

StepResult TraceEnvironment::step(int action) {
    if (!started_) {
        throw std::logic_error("TraceEnvironment::step() before reset()");
    }
    if (!valid_action(action)) {
        throw std::out_of_range("action " + std::to_string(action) + " outside [0, " +
                                std::to_string(Actions::ACTION_COUNT - 1) + "]");
    }
    applied_.push_back(action);

    StepResult r;
    if (cursor_ + 1 >= records_.size()) {
        // Ran off the recording: hold the last observation and stop the episode.
        r.obs = records_[cursor_].obs;
        r.truncated = true;
        r.info = json{{"trace_end", true}};
        needs_wrap_ = true;
        return r;
    }

    ++cursor_;
    const TraceRecord& rec = records_[cursor_];
    r.obs = rec.obs;
    r.reward = rec.reward;
    r.terminated = rec.terminated;
    r.truncated = rec.truncated;
    r.info = rec.info;
    return r;
}

int TraceEnvironment::action_count() const {
    return static_cast<int>(Actions::ACTION_COUNT);
}

ActionSetting TraceEnvironment::action_mapping(int action) const {
    if (!valid_action(action)) {
        throw std::out_of_range("action " + std::to_string(action) + " has no mapping");
    }
    return ACTION_TABLE[static_cast<size_t>(action)];
}

} // namespace hvacpilot
