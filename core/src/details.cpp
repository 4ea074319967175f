#include "specread/view/details.hpp"
#include "specread/format.hpp"

namespace specread {
namespace view {

SpectrumDetails describe(const Spectrum& spectrum) {
    SpectrumDetails d;
    d.path = spectrum.sourcePath();
    d.title = spectrum.title();
    d.mode = spectrum.modeCode();
    d.date = spectrum.date();
    d.time = spectrum.time();
    d.range = formatNumber(spectrum.xMin()) + " nm to " +
              formatNumber(spectrum.xMax()) + " nm";

    if (auto dx = spectrum.deltaX()) {
        d.delta_x = formatNumber(*dx);
    } else {
        d.delta_x = kUndefinedText;
    }

    if (const auto& range = spectrum.intensityRange()) {
        d.min_max = formatNumber(range->min_value) + "/" +
                    formatNumber(range->max_value) + " " + spectrum.unit().symbol;
    } else {
        d.min_max = kUndefinedText;
    }

    d.metadata = spectrum.metadata();
    return d;
}

} // namespace view
} // namespace specread
