#include "specread/view/plot_model.hpp"
#include "specread/algorithms/normalization.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace specread {
namespace view {

namespace {

std::string yAxisLabel(const SpectrumCollection& collection, bool uniform, bool normalize) {
    if (uniform) {
        const UnitLabel& unit = collection[0].unit();
        return normalize ? "Normalized " + unit.quantity + " in %" : unit.text();
    }
    if (normalize) {
        return "Warning: different units (normalized to 100 %)";
    }
    if (!collection.empty()) {
        return "Warning: different units.";
    }
    return "";
}

std::vector<PeakMarker> peakMarkers(const Spectrum& spectrum, const PlotSeries& series,
                                    const PeakList& peaks) {
    // Stems start at the raw minimum even for normalized plots
    const auto& range = spectrum.intensityRange();
    const Intensity base = range ? range->min_value : 0.0;

    std::vector<PeakMarker> markers;
    markers.reserve(peaks.size());
    for (const auto& peak : peaks) {
        PeakMarker m;
        m.x = peak.wavelength();
        m.y = peak.intensity();
        m.stem_base = base;
        m.annotation_y = series.y[peak.index()];
        m.label = peak.label();
        markers.push_back(std::move(m));
    }
    return markers;
}

} // namespace

PlotModel buildPlot(const SpectrumCollection& collection, const ViewFlags& flags,
                    const algorithms::PeakDetectionOptions& options) {
    PlotModel model;
    model.x_label = kWavelengthAxisLabel;
    model.normalized = flags.normalize;
    model.show_peaks = flags.show_peaks;

    if (!collection.empty()) {
        const std::string first = collection[0].unit().text();
        model.units_uniform = std::all_of(collection.begin(), collection.end(),
            [&first](const Spectrum& s) { return s.unit().text() == first; });
    }
    model.y_label = yAxisLabel(collection, model.units_uniform, flags.normalize);
    model.units_mismatch = !collection.empty() && !model.units_uniform && !flags.normalize;

    algorithms::PeakDetector detector(options);
    for (const auto& spectrum : collection) {
        PlotSeries series;
        series.name = spectrum.displayName();
        series.legend = spectrum.legendLabel();
        series.x = spectrum.wavelength();
        series.y = flags.normalize ? algorithms::normalizedIntensity(spectrum)
                                   : spectrum.intensity();

        if (flags.show_peaks) {
            try {
                PeakList peaks = detector.detect(series.x, series.y, flags.normalize);
                series.peaks = peakMarkers(spectrum, series, peaks);
            } catch (const SeriesTooShortError& e) {
                spdlog::warn("plot_model: no peaks for {}: {}", series.name, e.what());
                series.peak_error = e.what();
            }
        }
        model.series.push_back(std::move(series));
    }
    return model;
}

} // namespace view
} // namespace specread
