#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace specread {

/**
 * @brief A local maximum of a smoothed spectrum.
 *
 * Stores the data point index, the wavelength, the smoothed intensity at
 * that point and the label shown next to the peak marker.
 */
class Peak {
public:
    /// Default constructor
    Peak() = default;

    /// Construct with basic parameters
    Peak(Index index, Wavelength wavelength, Intensity intensity, std::string label = {})
        : index_(index), wavelength_(wavelength), intensity_(intensity),
          label_(std::move(label)) {}

    /// Index of the data point in the spectrum
    [[nodiscard]] Index index() const noexcept { return index_; }

    /// Get wavelength position
    [[nodiscard]] Wavelength wavelength() const noexcept { return wavelength_; }

    /// Get smoothed intensity at the apex
    [[nodiscard]] Intensity intensity() const noexcept { return intensity_; }

    /// Get annotation text
    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void setLabel(std::string label) { label_ = std::move(label); }

private:
    Index index_ = 0;
    Wavelength wavelength_ = 0.0;
    Intensity intensity_ = 0.0;
    std::string label_;
};

/**
 * @brief Peaks of one spectrum in ascending index order.
 */
class PeakList {
public:
    using iterator = std::vector<Peak>::iterator;
    using const_iterator = std::vector<Peak>::const_iterator;

    PeakList() = default;

    /// Get number of peaks
    [[nodiscard]] std::size_t size() const noexcept { return peaks_.size(); }

    /// Check if empty
    [[nodiscard]] bool empty() const noexcept { return peaks_.empty(); }

    /// Access peak by index
    [[nodiscard]] const Peak& operator[](std::size_t i) const { return peaks_[i]; }

    /// Iterator access
    const_iterator begin() const noexcept { return peaks_.begin(); }
    const_iterator end() const noexcept { return peaks_.end(); }

    /// Add a peak
    void add(Peak peak) { peaks_.push_back(std::move(peak)); }

    /// Reserve capacity
    void reserve(std::size_t n) { peaks_.reserve(n); }

    /// Get underlying vector
    [[nodiscard]] const std::vector<Peak>& peaks() const noexcept {
        return peaks_;
    }

private:
    std::vector<Peak> peaks_;
};

} // namespace specread
