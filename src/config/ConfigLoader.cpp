#include "hvacpilot/config/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace hvacpilot {

namespace {

std::string trim(const std::string& s) {
    const size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    const size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

bool ConfigLoader::load(const std::string& path) {
    const char* home = std::getenv("HOME");
    std::vector<std::string> paths = {
        path,
        "../" + path,
        std::string(home ? home : ".") + "/.config/hvacpilot/" + path
    };

    for (const auto& p : paths) {
        std::ifstream file(p);
        if (file.is_open()) {
            configPath_ = p;
            return parse(file);
        }
    }

    std::cerr << "[CONFIG] ERROR: " << path << " not found!\n";
    std::cerr << "[CONFIG] Searched paths:\n";
    for (const auto& p : paths) {
        std::cerr << "  - " << p << "\n";
    }
    return false;
}

bool ConfigLoader::loadFromStream(std::istream& in) {
    configPath_ = "<stream>";
    return parse(in);
}

bool ConfigLoader::has(const std::string& section, const std::string& key) const {
    return values_.find(section + "." + key) != values_.end();
}

std::string ConfigLoader::get(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it != values_.end()) {
        return it->second;
    }
    return defaultVal;
}

int ConfigLoader::getInt(const std::string& section, const std::string& key, int defaultVal) const {
    const std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        const int v = std::stoi(val, &used);
        if (used == val.size()) return v;
    } catch (const std::exception&) {
        // fall through to the warning below
    }
    std::cerr << "[CONFIG] WARN: " << section << "." << key << "=" << val
              << " is not an integer, using " << defaultVal << "\n";
    return defaultVal;
}

double ConfigLoader::getDouble(const std::string& section, const std::string& key, double defaultVal) const {
    const std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        const double v = std::stod(val, &used);
        if (used == val.size()) return v;
    } catch (const std::exception&) {
        // fall through to the warning below
    }
    std::cerr << "[CONFIG] WARN: " << section << "." << key << "=" << val
              << " is not a number, using " << defaultVal << "\n";
    return defaultVal;
}

bool ConfigLoader::getBool(const std::string& section, const std::string& key, bool defaultVal) const {
    const std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    std::cerr << "[CONFIG] WARN: " << section << "." << key << "=" << val
              << " is not a bool, using " << (defaultVal ? "true" : "false") << "\n";
    return defaultVal;
}

void ConfigLoader::dump() const {
    std::cout << "[CONFIG] Loaded from: " << configPath_ << "\n";
    std::cout << "[CONFIG] Values:\n";
    for (const auto& kv : values_) {
        std::cout << "  " << kv.first << " = " << kv.second << "\n";
    }
}

bool ConfigLoader::parse(std::istream& in) {
    values_.clear();

    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        // Section header
        if (line[0] == '[') {
            const size_t closePos = line.find(']');
            if (closePos != std::string::npos) {
                currentSection = trim(line.substr(1, closePos - 1));
            }
            continue;
        }

        // Key = Value
        const size_t eqPos = line.find('=');
        if (eqPos != std::string::npos) {
            const std::string key = trim(line.substr(0, eqPos));
            const std::string value = trim(line.substr(eqPos + 1));
            values_[currentSection + "." + key] = value;
        }
    }

    return !values_.empty();
}

} // namespace hvacpilot
