#include "hvacpilot/policy/ActivationRule.hpp"

#include <algorithm>
#include <cctype>

namespace hvacpilot {

const char* activation_mode_str(ActivationMode m) noexcept {
    switch (m) {
        case ActivationMode::STRICT: return "strict";
        case ActivationMode::MARGIN: return "margin";
    }
    return "unknown";
}

bool parse_activation_mode(const std::string& text, ActivationMode& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "strict") {
        out = ActivationMode::STRICT;
        return true;
    }
    if (lower == "margin") {
        out = ActivationMode::MARGIN;
        return true;
    }
    return false;
}

bool ActivationRule::active(double air_temp, const ComfortBand& band) const noexcept {
    if (mode == ActivationMode::MARGIN) {
        return (air_temp - band.high) > margin ||
               (band.low - air_temp) > margin;
    }
    return band.above(air_temp) || band.below(air_temp);
}

} // namespace hvacpilot
