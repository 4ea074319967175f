#pragma once

#include "format_sniffer.hpp"
#include "spectrum_parser.hpp"
#include <string>

namespace specread {
namespace io {

/**
 * @brief Options for reading a spectrum file.
 */
struct SpectrumReaderOptions {
    /// Asked for a delimiter when none is detected (nullptr = fail)
    DelimiterPrompt prompt = nullptr;

    /// Parsing options
    ParserOptions parser;
};

/**
 * @brief Read, sniff and parse one text export.
 *
 * Usage:
 * @code
 * Spectrum spec = io::loadSpectrum("sample.txt");
 * @endcode
 *
 * @param filename Path to the file (plain or gzip-compressed)
 * @param options Reading options
 * @return Parsed spectrum
 * @throws IoError if the file cannot be read
 * @throws FormatError if the delimiter or data block cannot be determined
 * @throws DegenerateDataError in strict mode, see ParserOptions
 */
Spectrum loadSpectrum(const std::string& filename,
                      const SpectrumReaderOptions& options = {});

} // namespace io
} // namespace specread
