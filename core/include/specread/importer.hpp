#pragma once

#include "shell.hpp"
#include "spectrum_collection.hpp"
#include "io/spectrum_reader.hpp"
#include "view/plot_model.hpp"
#include <string>
#include <vector>

namespace specread {

/**
 * @brief Options for importing files.
 */
struct ImportOptions {
    /// Parsing options applied to every file
    io::ParserOptions parser;

    /// Peak detection settings used when refreshing the view
    algorithms::PeakDetectionOptions peaks;
};

/**
 * @brief Outcome of a batch import.
 */
struct ImportSummary {
    /// Display names added to the collection
    std::vector<std::string> imported;

    /// Display names that were refused or failed to load
    std::vector<std::string> failed;
};

/**
 * @brief Loads files into a collection and reports problems to a shell.
 *
 * Each file is imported on its own: a duplicate name, unreadable file or
 * malformed content is reported through Shell::reportError and the next
 * file is processed. The collection only ever receives complete spectra.
 */
class Importer {
public:
    Importer(SpectrumCollection& collection, Shell& shell, ImportOptions options = {})
        : collection_(collection), shell_(shell), options_(std::move(options)) {}

    /**
     * @brief Import files in order.
     *
     * Empty paths are ignored.
     */
    ImportSummary importFiles(const std::vector<std::string>& paths);

    /**
     * @brief Import one file.
     *
     * @return true if the spectrum was added
     */
    bool importFile(const std::string& path);

    /**
     * @brief Build the plot for the current collection and hand it to the
     * shell.
     *
     * Reports a UNITS_MISMATCH warning when raw spectra with different units
     * are shown together, and SERIES_TOO_SHORT for each series without
     * peaks.
     */
    void refreshView(const view::ViewFlags& flags) const;

    const ImportOptions& options() const { return options_; }

private:
    SpectrumCollection& collection_;
    Shell& shell_;
    ImportOptions options_;
};

} // namespace specread
