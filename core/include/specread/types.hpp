#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <limits>
#include <cmath>

namespace specread {

/// Wavelength in nanometres
using Wavelength = double;

/// Intensity value type (absorbance, transmission, counts, ...)
using Intensity = double;

/// Index type for data points
using Index = std::size_t;

/// One delimited line of an input file
using RawRow = std::vector<std::string>;

/// Header label/value pair, always exactly two strings
using MetadataPair = std::pair<std::string, std::string>;

/// Ordered header metadata (insertion order of the source file)
using MetaData = std::vector<MetadataPair>;

/// Sentinel for missing or malformed intensity cells
inline constexpr Intensity kMissingIntensity =
    std::numeric_limits<Intensity>::quiet_NaN();

/// Default value for header fields that could not be found
inline constexpr const char* kUnknownValue = "Unknown";

/// Default mode code when the header names no unit
inline constexpr const char* kUnknownMode = "unknown units";

/**
 * @brief Display unit resolved from a mode code.
 *
 * The three parts are rendered back to back, e.g.
 * "Transmission" + " in " + "%".
 */
struct UnitLabel {
    std::string quantity;
    std::string separator;
    std::string symbol;

    UnitLabel() = default;
    UnitLabel(std::string q, std::string sep, std::string sym)
        : quantity(std::move(q)), separator(std::move(sep)), symbol(std::move(sym)) {}

    /// Full axis label text
    [[nodiscard]] std::string text() const {
        return quantity + separator + symbol;
    }

    bool operator==(const UnitLabel& other) const {
        return quantity == other.quantity && separator == other.separator &&
               symbol == other.symbol;
    }
    bool operator!=(const UnitLabel& other) const { return !(*this == other); }
};

/// Range template for min/max values
template<typename T>
struct Range {
    T min_value = std::numeric_limits<T>::max();
    T max_value = std::numeric_limits<T>::lowest();

    Range() = default;
    Range(T min_val, T max_val) : min_value(min_val), max_value(max_val) {}

    T span() const { return max_value - min_value; }

    void extend(T value) {
        if (value < min_value) min_value = value;
        if (value > max_value) max_value = value;
    }
};

using IntensityRange = Range<Intensity>;

/// Kinds of problems reported to the shell
enum class ErrorKind : std::uint8_t {
    FORMAT = 0,
    IO,
    DUPLICATE_NAME,
    DEGENERATE_DATA,
    SERIES_TOO_SHORT,
    UNITS_MISMATCH      // Warning only, rendering continues
};

/// Convert error kind to string
inline std::string toString(ErrorKind k) {
    switch (k) {
        case ErrorKind::FORMAT: return "format error";
        case ErrorKind::IO: return "i/o error";
        case ErrorKind::DUPLICATE_NAME: return "duplicate name";
        case ErrorKind::DEGENERATE_DATA: return "degenerate data";
        case ErrorKind::SERIES_TOO_SHORT: return "series too short";
        case ErrorKind::UNITS_MISMATCH: return "units mismatch";
        default: return "unknown";
    }
}

} // namespace specread
