#include "specread/algorithms/peak_detection.hpp"
#include "specread/algorithms/normalization.hpp"
#include "specread/format.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace specread {
namespace algorithms {

std::vector<Index> PeakDetector::findLocalMaxima(const std::vector<double>& values) {
    std::vector<Index> maxima;
    for (Index i = 1; i + 1 < values.size(); ++i) {
        if (values[i] > values[i - 1] && values[i] > values[i + 1]) {
            maxima.push_back(i);
        }
    }
    return maxima;
}

std::string PeakDetector::peakLabel(Wavelength wavelength, Intensity intensity,
                                    bool normalized) const {
    if (normalized) {
        return formatNumber(wavelength) + " nm";
    }
    const double scale = std::pow(10.0, options_.label_decimals);
    const double rounded = std::nearbyint(intensity * scale) / scale;
    return "(" + formatNumber(wavelength) + "|" + formatNumber(rounded) + ")";
}

PeakList PeakDetector::detect(const std::vector<Wavelength>& wavelength,
                              const std::vector<Intensity>& values,
                              bool normalized) const {
    if (wavelength.size() != values.size()) {
        throw std::invalid_argument("wavelength and intensity arrays must have same size");
    }

    Smoother smoother(options_.smoothing);
    const std::vector<double> smoothed = smoother.smooth(values);

    PeakList peaks;
    for (Index i : findLocalMaxima(smoothed)) {
        peaks.add(Peak(i, wavelength[i], smoothed[i],
                       peakLabel(wavelength[i], smoothed[i], normalized)));
    }
    return peaks;
}

PeakList PeakDetector::detect(const Spectrum& spectrum, bool normalize) const {
    PeakList peaks = normalize
        ? detect(spectrum.wavelength(), normalizedIntensity(spectrum), true)
        : detect(spectrum.wavelength(), spectrum.intensity(), false);

    spdlog::debug("peak_detection: {} peaks in {}", peaks.size(), spectrum.displayName());
    return peaks;
}

} // namespace algorithms
} // namespace specread
