#pragma once

#include "../spectrum.hpp"
#include "../peak.hpp"
#include "smoothing.hpp"
#include <string>
#include <vector>

namespace specread {
namespace algorithms {

/**
 * @brief Options for peak detection
 */
struct PeakDetectionOptions {
    /// Smoothing applied before searching maxima (31 points, cubic)
    SmoothingOptions smoothing;

    /// Decimals of the intensity in raw-mode labels
    int label_decimals = 2;
};

/**
 * @brief Finds local maxima of smoothed spectra.
 *
 * The series is optionally normalized to 0-100 %, smoothed with a
 * Savitzky-Golay filter, and every point strictly greater than both
 * neighbours is reported. Plateaus and the two end points are never
 * peaks. Labels read "<wavelength> nm" for normalized series and
 * "(<wavelength>|<intensity>)" otherwise.
 */
class PeakDetector {
public:
    PeakDetector() = default;
    explicit PeakDetector(const PeakDetectionOptions& options)
        : options_(options) {}

    /**
     * @brief Detect peaks of a spectrum.
     *
     * @param spectrum Input spectrum
     * @param normalize Normalize intensities before smoothing
     * @return Detected peaks, smoothed intensities
     * @throws SeriesTooShortError if the spectrum is shorter than the
     *         smoothing window
     */
    PeakList detect(const Spectrum& spectrum, bool normalize) const;

    /**
     * @brief Detect peaks of an already prepared series.
     *
     * @param wavelength Wavelengths
     * @param values Intensities to smooth (normalized or raw)
     * @param normalized Whether @p values are normalized (affects labels)
     * @throws std::invalid_argument if the arrays differ in size
     * @throws SeriesTooShortError if the series is shorter than the window
     */
    PeakList detect(const std::vector<Wavelength>& wavelength,
                    const std::vector<Intensity>& values,
                    bool normalized) const;

    /**
     * @brief Indices of strict local maxima.
     *
     * A point is a maximum if it is strictly greater than both neighbours.
     */
    static std::vector<Index> findLocalMaxima(const std::vector<double>& values);

    /// Annotation text for a peak
    std::string peakLabel(Wavelength wavelength, Intensity intensity, bool normalized) const;

    /**
     * @brief Get/set options
     */
    const PeakDetectionOptions& options() const { return options_; }
    void setOptions(const PeakDetectionOptions& opt) { options_ = opt; }

private:
    PeakDetectionOptions options_;
};

/**
 * @brief Convenience function for peak detection.
 */
inline PeakList detectPeaks(const Spectrum& spectrum, bool normalize,
                            const PeakDetectionOptions& options = {}) {
    PeakDetector detector(options);
    return detector.detect(spectrum, normalize);
}

} // namespace algorithms
} // namespace specread
