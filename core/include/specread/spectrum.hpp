#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace specread {

/**
 * @brief Header information extracted from an instrument export.
 *
 * Fields that could not be found keep their "unknown" defaults.
 */
struct SpectrumHeader {
    /// Header rows as label/value pairs, in file order
    MetaData metadata;

    std::string title = kUnknownValue;
    std::string date = kUnknownValue;
    std::string time = kUnknownValue;

    /// Raw unit/measurement mode token (e.g. "%T", "A", "INTENSITY")
    std::string mode = kUnknownMode;
};

/**
 * @brief Represents one measured spectrum loaded from a text export.
 *
 * A Spectrum stores paired arrays of wavelengths and intensities in source
 * order together with the header metadata of the file. It is immutable
 * once constructed; the derived statistics (range, spacing, intensity
 * min/max) and the display unit are computed by the constructor.
 *
 * Intensities may contain NaN for cells that could not be parsed. If every
 * intensity is NaN the intensity range is undefined and yMin()/yMax()
 * throw DegenerateDataError; use intensityRange() to check first.
 */
class Spectrum {
public:
    /**
     * @brief Construct a spectrum.
     *
     * @param source_path Path of the file the data was read from
     * @param wavelength Wavelengths in nm, source order
     * @param intensity Intensities aligned with @p wavelength
     * @param header Header metadata
     * @throws std::invalid_argument if the arrays differ in size
     * @throws FormatError if the series is empty
     */
    Spectrum(std::string source_path,
             std::vector<Wavelength> wavelength,
             std::vector<Intensity> intensity,
             SpectrumHeader header = {});

    Spectrum(Spectrum&&) noexcept = default;
    Spectrum& operator=(Spectrum&&) noexcept = default;
    Spectrum(const Spectrum&) = default;
    Spectrum& operator=(const Spectrum&) = default;

    // =========================================================================
    // Identification
    // =========================================================================

    /// Path the spectrum was loaded from
    [[nodiscard]] const std::string& sourcePath() const noexcept { return source_path_; }

    /// File base name, the key in a SpectrumCollection
    [[nodiscard]] std::string displayName() const { return displayNameFor(source_path_); }

    /// Display name without ".txt", used for plot legends
    [[nodiscard]] std::string legendLabel() const;

    /// Base name of a path ("" for paths ending in a separator)
    static std::string displayNameFor(const std::string& path);

    // =========================================================================
    // Data Access
    // =========================================================================

    /// Get number of data points
    [[nodiscard]] std::size_t size() const noexcept { return wavelength_.size(); }

    /// Get wavelength array
    [[nodiscard]] const std::vector<Wavelength>& wavelength() const noexcept {
        return wavelength_;
    }

    /// Get intensity array
    [[nodiscard]] const std::vector<Intensity>& intensity() const noexcept {
        return intensity_;
    }

    /// Get wavelength at index
    [[nodiscard]] Wavelength wavelengthAt(Index i) const { return wavelength_.at(i); }

    /// Get intensity at index
    [[nodiscard]] Intensity intensityAt(Index i) const { return intensity_.at(i); }

    // =========================================================================
    // Metadata
    // =========================================================================

    [[nodiscard]] const MetaData& metadata() const noexcept { return header_.metadata; }
    [[nodiscard]] const std::string& title() const noexcept { return header_.title; }
    [[nodiscard]] const std::string& date() const noexcept { return header_.date; }
    [[nodiscard]] const std::string& time() const noexcept { return header_.time; }
    [[nodiscard]] const std::string& modeCode() const noexcept { return header_.mode; }

    /// Display unit resolved from the mode code
    [[nodiscard]] const UnitLabel& unit() const noexcept { return unit_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    /// First wavelength (source order, not a sorted minimum)
    [[nodiscard]] Wavelength xMin() const noexcept { return wavelength_.front(); }

    /// Last wavelength (source order, not a sorted maximum)
    [[nodiscard]] Wavelength xMax() const noexcept { return wavelength_.back(); }

    /// Spacing of the first two points, nullopt for single-point spectra
    [[nodiscard]] std::optional<Wavelength> deltaX() const noexcept { return delta_x_; }

    /// Intensity min/max ignoring NaN, nullopt if every value is NaN
    [[nodiscard]] const std::optional<IntensityRange>& intensityRange() const noexcept {
        return intensity_range_;
    }

    /// Smallest intensity
    /// @throws DegenerateDataError if the intensity range is undefined
    [[nodiscard]] Intensity yMin() const { return requireRange().min_value; }

    /// Largest intensity
    /// @throws DegenerateDataError if the intensity range is undefined
    [[nodiscard]] Intensity yMax() const { return requireRange().max_value; }

private:
    const IntensityRange& requireRange() const;
    void updateStatistics();

    std::string source_path_;
    std::vector<Wavelength> wavelength_;
    std::vector<Intensity> intensity_;
    SpectrumHeader header_;
    UnitLabel unit_;

    // Cached statistics
    std::optional<Wavelength> delta_x_;
    std::optional<IntensityRange> intensity_range_;
};

} // namespace specread
