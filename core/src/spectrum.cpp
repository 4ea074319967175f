#include "specread/spectrum.hpp"
#include "specread/units.hpp"
#include <filesystem>
#include <stdexcept>

namespace specread {

Spectrum::Spectrum(std::string source_path,
                   std::vector<Wavelength> wavelength,
                   std::vector<Intensity> intensity,
                   SpectrumHeader header)
    : source_path_(std::move(source_path)),
      wavelength_(std::move(wavelength)),
      intensity_(std::move(intensity)),
      header_(std::move(header)) {
    if (wavelength_.size() != intensity_.size()) {
        throw std::invalid_argument("wavelength and intensity arrays must have same size");
    }
    if (wavelength_.empty()) {
        throw FormatError("no data points in '" + source_path_ + "'");
    }
    unit_ = resolveUnit(header_.mode);
    updateStatistics();
}

std::string Spectrum::displayNameFor(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

std::string Spectrum::legendLabel() const {
    static const std::string suffix = ".txt";
    std::string label = displayName();
    std::size_t pos = 0;
    while ((pos = label.find(suffix, pos)) != std::string::npos) {
        label.erase(pos, suffix.size());
    }
    return label;
}

const IntensityRange& Spectrum::requireRange() const {
    if (!intensity_range_) {
        throw DegenerateDataError("every intensity value of '" + displayName() +
                                  "' is NaN");
    }
    return *intensity_range_;
}

void Spectrum::updateStatistics() {
    delta_x_.reset();
    if (wavelength_.size() >= 2) {
        delta_x_ = wavelength_[1] - wavelength_[0];
    }

    intensity_range_.reset();
    for (Intensity y : intensity_) {
        if (std::isnan(y)) continue;
        if (intensity_range_) {
            intensity_range_->extend(y);
        } else {
            intensity_range_ = IntensityRange(y, y);
        }
    }
}

} // namespace specread
