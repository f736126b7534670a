#include "hvacpilot/core/Observation.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace hvacpilot {

Observation Observation::from_values(const std::vector<double>& values) {
    if (values.size() != SIZE) {
        throw std::invalid_argument(
            "observation must have " + std::to_string(SIZE) +
            " values, got " + std::to_string(values.size()));
    }

    std::array<double, SIZE> arr{};
    for (std::size_t i = 0; i < SIZE; ++i) {
        if (!std::isfinite(values[i])) {
            throw std::invalid_argument(
                "observation value " + std::to_string(i) + " is not finite");
        }
        arr[i] = values[i];
    }
    return Observation(arr);
}

} // namespace hvacpilot
