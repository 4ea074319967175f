#include "specread/importer.hpp"
#include <spdlog/spdlog.h>

namespace specread {

bool Importer::importFile(const std::string& path) {
    const std::string name = Spectrum::displayNameFor(path);

    if (collection_.contains(name)) {
        DuplicateNameError error(name);
        spdlog::warn("importer: {} refused: {}", path, error.what());
        shell_.reportError(error.kind(), error.what());
        return false;
    }

    io::SpectrumReaderOptions reader_options;
    reader_options.parser = options_.parser;
    reader_options.prompt = [this](const std::string& display_name) {
        return shell_.promptDelimiter(display_name);
    };

    try {
        const Spectrum& stored = collection_.add(io::loadSpectrum(path, reader_options));
        spdlog::info("importer: {} imported, {} points, unit '{}'",
                     name, stored.size(), stored.unit().text());
        return true;
    } catch (const Error& e) {
        spdlog::warn("importer: {} skipped: {}", path, e.what());
        shell_.reportError(e.kind(), e.what());
        return false;
    }
}

ImportSummary Importer::importFiles(const std::vector<std::string>& paths) {
    ImportSummary summary;
    for (const auto& path : paths) {
        if (path.empty()) continue;

        if (importFile(path)) {
            summary.imported.push_back(Spectrum::displayNameFor(path));
        } else {
            summary.failed.push_back(Spectrum::displayNameFor(path));
        }
    }
    return summary;
}

void Importer::refreshView(const view::ViewFlags& flags) const {
    view::PlotModel model = view::buildPlot(collection_, flags, options_.peaks);

    if (model.units_mismatch) {
        shell_.reportError(ErrorKind::UNITS_MISMATCH,
                           "the units of the loaded spectra differ, "
                           "the data may not be comparable");
    }
    for (const auto& series : model.series) {
        if (series.peak_error) {
            shell_.reportError(ErrorKind::SERIES_TOO_SHORT,
                               series.name + ": " + *series.peak_error);
        }
    }
    shell_.renderSpectra(model);
}

} // namespace specread
