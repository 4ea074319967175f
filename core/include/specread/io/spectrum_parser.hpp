#pragma once

#include "../spectrum.hpp"
#include "../errors.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace specread {
namespace io {

/**
 * @brief Options for spectrum parsing.
 */
struct ParserOptions {
    /// Build the spectrum even if every intensity is NaN (range undefined).
    /// When false, parse() throws DegenerateDataError instead.
    bool allow_degenerate_intensity = true;

    /// Value for title, date and time when not found in the header
    std::string unknown_value = kUnknownValue;

    /// Mode code when the file has no header
    std::string unknown_mode = kUnknownMode;
};

/**
 * @brief Header rows of a file, each padded to at least two cells.
 */
struct HeaderBlock {
    std::vector<RawRow> rows;

    [[nodiscard]] bool empty() const noexcept { return rows.empty(); }
};

/**
 * @brief One way of finding a header field.
 *
 * Returns std::nullopt when the rule does not apply. An empty string is a
 * valid result (e.g. a label row without a value).
 */
using FieldRule = std::function<std::optional<std::string>(const HeaderBlock&)>;

/**
 * @brief Rule matching the first cell of a header row.
 *
 * Finds the first row whose first cell contains a match of @p pattern
 * (case-insensitive) and yields its last cell, optionally transformed.
 */
FieldRule labelRule(const std::string& pattern,
                    std::function<std::string(std::string)> transform = nullptr);

/**
 * @brief Rule searching @p pattern in the first header row.
 *
 * Only the first row is inspected, later rows are never searched. Yields
 * the matched text.
 */
FieldRule firstRowPatternRule(const std::string& pattern);

/**
 * @brief Rule yielding the last cell of the last header row.
 */
FieldRule lastRowRule();

/**
 * @brief Apply rules in order; the first one that yields a value wins.
 */
std::optional<std::string> applyRules(const std::vector<FieldRule>& rules,
                                      const HeaderBlock& header);

/**
 * @brief Parser turning sniffed rows into a Spectrum.
 *
 * The first row whose first cell is a number starts the data block; all
 * rows before it are the header. Header fields:
 *  - title: last cell of the first header row
 *  - date:  row labelled "date|Datum| am", else DD.MM.YYYY in the first row
 *  - time:  row labelled "time|Zeit| um", else HH:MM:SS in the first row
 *  - mode:  row labelled "YUNITS|Modus", else last cell before the data
 *
 * Data rows need a numeric first cell (wavelength); a missing or malformed
 * second cell becomes NaN.
 */
class SpectrumParser {
public:
    SpectrumParser() = default;
    explicit SpectrumParser(ParserOptions options)
        : options_(std::move(options)) {}

    /**
     * @brief Parse rows into a spectrum.
     *
     * @param rows Rows of the file as produced by the FormatSniffer
     * @param source_path Path stored in the spectrum
     * @return Parsed spectrum
     * @throws FormatError if there is no data row or a wavelength cell is
     *         not numeric
     * @throws DegenerateDataError if every intensity is NaN and
     *         allow_degenerate_intensity is false
     */
    Spectrum parse(const std::vector<RawRow>& rows,
                   const std::string& source_path) const;

    /**
     * @brief Extract title, date, time, mode and metadata pairs.
     *
     * @param header_rows Rows before the data block
     */
    SpectrumHeader extractHeader(std::vector<RawRow> header_rows) const;

    /**
     * @brief Index of the first row whose first cell is a number.
     */
    [[nodiscard]] static std::optional<Index> findDataStart(const std::vector<RawRow>& rows);

    /**
     * @brief Parse a floating-point cell.
     *
     * Surrounding whitespace and a leading sign are accepted, as are
     * "nan", "inf" and "infinity" in any case. Locale independent.
     *
     * @return Value, or nullopt if the cell is not a number
     */
    [[nodiscard]] static std::optional<double> parseNumber(const std::string& text);

    /// Rules for the measurement date
    static std::vector<FieldRule> dateRules();

    /// Rules for the measurement time
    static std::vector<FieldRule> timeRules();

    /// Rules for the mode (unit) code
    static std::vector<FieldRule> modeRules();

    const ParserOptions& options() const { return options_; }
    void setOptions(ParserOptions opt) { options_ = std::move(opt); }

private:
    ParserOptions options_;
};

/**
 * @brief Convenience function for parsing sniffed rows.
 */
inline Spectrum parseSpectrum(const std::vector<RawRow>& rows,
                              const std::string& source_path,
                              const ParserOptions& options = {}) {
    SpectrumParser parser(options);
    return parser.parse(rows, source_path);
}

} // namespace io
} // namespace specread
