// ═══════════════════════════════════════════════════════════════════════════════
// include/hvacpilot/policy/ActivationRule.hpp
// ═══════════════════════════════════════════════════════════════════════════════
// PURPOSE: Decide whether active heating/cooling is required
//
// STRICT - active as soon as the air temperature leaves [low, high].
// MARGIN - active only once the temperature is MORE than `margin` outside the
//          band. Gives a dead-band of width 2*margin around the comfort band
//          so the controller does not chatter at the edges.
//
// Exactly at low-margin or high+margin the MARGIN rule is still inactive.
// ═══════════════════════════════════════════════════════════════════════════════
#pragma once

#include <cstdint>
#include <string>

#include "hvacpilot/policy/ComfortBand.hpp"

namespace hvacpilot {

enum class ActivationMode : uint8_t {
    STRICT = 0,
    MARGIN = 1
};

const char* activation_mode_str(ActivationMode m) noexcept;

// Accepts "strict" / "margin" (case-insensitive). Returns false on anything else.
bool parse_activation_mode(const std::string& text, ActivationMode& out);

struct ActivationRule {
    ActivationMode mode = ActivationMode::STRICT;
    double margin = 0.5;  // MARGIN mode only

    ActivationRule() = default;

    ActivationRule(ActivationMode m, double margin_c)
        : mode(m)
        , margin(margin_c)
    {}

    [[nodiscard]] bool active(double air_temp, const ComfortBand& band) const noexcept;
};

} // namespace hvacpilot
