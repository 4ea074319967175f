#include "specread/algorithms/normalization.hpp"

namespace specread {
namespace algorithms {

std::vector<Intensity> normalizeIntensity(const std::vector<Intensity>& intensity,
                                          const std::optional<IntensityRange>& range) {
    if (!range || range->max_value == 0.0) {
        return intensity;
    }

    const Intensity min = range->min_value;
    const Intensity span = range->span();
    std::vector<Intensity> result;
    result.reserve(intensity.size());
    for (Intensity y : intensity) {
        result.push_back((y - min) / span * 100.0);
    }
    return result;
}

} // namespace algorithms
} // namespace specread
