#pragma once

#include "../spectrum.hpp"
#include <optional>
#include <vector>

namespace specread {
namespace algorithms {

/**
 * @brief Scale intensities to 0-100 % of their range.
 *
 * Computes (y - min) / (max - min) * 100. The values are returned unchanged
 * when @p range is undefined or its maximum is exactly 0. Only the maximum
 * is checked: a flat series with a non-zero maximum divides by zero.
 *
 * @param intensity Values to scale (NaN stays NaN)
 * @param range Intensity range of the values
 * @return Scaled values
 */
std::vector<Intensity> normalizeIntensity(const std::vector<Intensity>& intensity,
                                          const std::optional<IntensityRange>& range);

/**
 * @brief Normalized intensities of a spectrum.
 */
inline std::vector<Intensity> normalizedIntensity(const Spectrum& spectrum) {
    return normalizeIntensity(spectrum.intensity(), spectrum.intensityRange());
}

} // namespace algorithms
} // namespace specread
