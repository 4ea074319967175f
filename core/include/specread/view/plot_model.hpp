#pragma once

#include "../spectrum_collection.hpp"
#include "../algorithms/peak_detection.hpp"
#include <optional>
#include <string>
#include <vector>

namespace specread {
namespace view {

/**
 * @brief View switches owned by the shell.
 */
struct ViewFlags {
    /// Scale every series to 0-100 %
    bool normalize = false;

    /// Detect and draw peaks
    bool show_peaks = false;
};

/**
 * @brief One peak marker: dot, vertical stem and annotation.
 */
struct PeakMarker {
    /// Apex position (wavelength, smoothed intensity)
    Wavelength x = 0.0;
    Intensity y = 0.0;

    /// Lower end of the stem (raw intensity minimum of the spectrum)
    Intensity stem_base = 0.0;

    /// Annotation anchor: plotted (unsmoothed) value at the apex
    Intensity annotation_y = 0.0;

    /// Vertical annotation offset in pixels
    int annotation_offset_px = 10;

    std::string label;
};

/**
 * @brief One line of the plot.
 */
struct PlotSeries {
    /// Display name of the spectrum
    std::string name;

    /// Legend entry (display name without ".txt")
    std::string legend;

    std::vector<Wavelength> x;

    /// Plotted values (normalized when requested)
    std::vector<Intensity> y;

    std::vector<PeakMarker> peaks;

    /// Set when peaks were requested but could not be computed
    std::optional<std::string> peak_error;
};

/**
 * @brief Everything a renderer needs to draw the loaded spectra.
 */
struct PlotModel {
    std::string x_label;
    std::string y_label;

    /// All spectra share one unit label
    bool units_uniform = false;

    /// Units differ and the raw values are shown
    bool units_mismatch = false;

    bool normalized = false;
    bool show_peaks = false;

    std::vector<PlotSeries> series;
};

/// Label of the wavelength axis
inline constexpr const char* kWavelengthAxisLabel = "Wavelength λ in nm";

/**
 * @brief Build the plot model for a collection.
 *
 * Pure function of its inputs; any shell (embedded or standalone window,
 * console) draws from the result. A series too short for peak detection
 * gets a peak_error and no markers, other series are unaffected.
 *
 * @param collection Loaded spectra
 * @param flags Normalize / show peaks switches
 * @param options Peak detection settings
 * @return Plot model
 */
PlotModel buildPlot(const SpectrumCollection& collection, const ViewFlags& flags,
                    const algorithms::PeakDetectionOptions& options = {});

} // namespace view
} // namespace specread
