#include "hvacpilot/policy/ComfortBand.hpp"

namespace hvacpilot {

std::set<int> default_winter_months() {
    return {11, 12, 1, 2, 3};
}

ComfortBand comfort_band(int month, const std::set<int>& winter_months) {
    if (winter_months.count(month) > 0) {
        return {Comfort::WINTER_LOW, Comfort::WINTER_HIGH};
    }
    return {Comfort::SUMMER_LOW, Comfort::SUMMER_HIGH};
}

} // namespace hvacpilot
