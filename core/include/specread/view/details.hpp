#pragma once

#include "../spectrum.hpp"
#include <string>

namespace specread {
namespace view {

/// Text shown for statistics that are not defined
inline constexpr const char* kUndefinedText = "undefined";

/**
 * @brief Formatted fields of the details panel for one spectrum.
 */
struct SpectrumDetails {
    std::string path;
    std::string title;
    std::string mode;
    std::string date;
    std::string time;

    /// "<first> nm to <last> nm"
    std::string range;

    /// Spacing of the first two points or "undefined"
    std::string delta_x;

    /// "<min>/<max> <unit symbol>" or "undefined"
    std::string min_max;

    /// Header label/value pairs
    MetaData metadata;
};

/**
 * @brief Describe a spectrum for display.
 *
 * Never throws for degenerate spectra: undefined statistics are shown as
 * "undefined".
 */
SpectrumDetails describe(const Spectrum& spectrum);

} // namespace view
} // namespace specread
