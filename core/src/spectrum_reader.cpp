#include "specread/io/spectrum_reader.hpp"
#include "specread/io/text_file.hpp"
#include <spdlog/spdlog.h>

namespace specread {
namespace io {

Spectrum loadSpectrum(const std::string& filename, const SpectrumReaderOptions& options) {
    const std::string content = normalizeNewlines(readTextFile(filename));
    const std::vector<std::string> lines = splitLines(content);

    FormatSnifferOptions sniffer_options;
    sniffer_options.prompt = options.prompt;
    sniffer_options.display_name = Spectrum::displayNameFor(filename);
    FormatSniffer sniffer(std::move(sniffer_options));
    SniffResult sniffed = sniffer.sniff(content, lines);

    SpectrumParser parser(options.parser);
    Spectrum spectrum = parser.parse(sniffed.rows, filename);

    spdlog::debug("spectrum_reader: {} read, {} lines, {} points",
                  filename, lines.size(), spectrum.size());
    return spectrum;
}

} // namespace io
} // namespace specread
