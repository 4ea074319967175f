#pragma once

/**
 * @file specread.hpp
 * @brief Main header for the specread core library.
 *
 * Include this header to get access to all specread functionality.
 *
 * @example
 * @code
 * #include <specread/specread.hpp>
 *
 * int main() {
 *     // Load a text export (delimiter and decimal separator are detected)
 *     auto spectrum = specread::io::loadSpectrum("sample.txt");
 *
 *     // Find peaks on the normalized, smoothed series
 *     for (const auto& peak : specread::algorithms::detectPeaks(spectrum, true)) {
 *         std::cout << peak.label() << "\n";
 *     }
 *
 *     return 0;
 * }
 * @endcode
 */

// Core types
#include "types.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "units.hpp"

// Data structures
#include "spectrum.hpp"
#include "peak.hpp"
#include "spectrum_collection.hpp"

// I/O
#include "io/text_file.hpp"
#include "io/format_sniffer.hpp"
#include "io/spectrum_parser.hpp"
#include "io/spectrum_reader.hpp"

// Algorithms
#include "algorithms/smoothing.hpp"
#include "algorithms/normalization.hpp"
#include "algorithms/peak_detection.hpp"

// View models and shell interface
#include "view/plot_model.hpp"
#include "view/details.hpp"
#include "shell.hpp"
#include "importer.hpp"

/**
 * @namespace specread
 * @brief Root namespace for the specread library.
 */

/**
 * @namespace specread::io
 * @brief Reading and sniffing instrument text exports.
 */

/**
 * @namespace specread::algorithms
 * @brief Smoothing, normalization and peak detection.
 */

/**
 * @namespace specread::view
 * @brief Display-independent view models.
 */
