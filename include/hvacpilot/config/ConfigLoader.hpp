#pragma once
// =============================================================================
// ConfigLoader.hpp - INI File Parser for hvacpilot Configuration
// =============================================================================
// Loads [section] key = value pairs. Keys are stored as "section.key".
// Lines starting with '#' or ';' are comments.
// =============================================================================

#include <istream>
#include <string>
#include <unordered_map>

namespace hvacpilot {

class ConfigLoader {
public:
    static ConfigLoader& instance() {
        static ConfigLoader inst;
        return inst;
    }

    ConfigLoader() = default;

    // Tries `path`, then ../path, then $HOME/.config/hvacpilot/<path>.
    // Returns false (and lists the searched paths) when none can be opened.
    bool load(const std::string& path = "hvacpilot.ini");

    // Parse already-open INI text. Replaces any previously loaded values.
    bool loadFromStream(std::istream& in);

    bool has(const std::string& section, const std::string& key) const;

    std::string get(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int getInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double getDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    bool getBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    const std::string& getConfigPath() const { return configPath_; }

    void dump() const;

private:
    bool parse(std::istream& in);

    std::unordered_map<std::string, std::string> values_;
    std::string configPath_;
};

} // namespace hvacpilot
