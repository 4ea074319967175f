/**
 * Console front end for the specread library.
 *
 * Usage:
 *   spectrum_reader [--normalize] [--peaks] [--delimiter STR]
 *                   [--verbose | --quiet] FILE...
 *
 * Imports every FILE, prints the details of each loaded spectrum and the
 * resulting plot (axis labels, series, peaks).
 */

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "specread/specread.hpp"

using namespace specread;

namespace {

/**
 * Shell implementation on stdin/stdout/stderr.
 */
class ConsoleShell : public Shell {
public:
    explicit ConsoleShell(std::optional<std::string> delimiter)
        : delimiter_(std::move(delimiter)) {}

    std::optional<std::string> promptDelimiter(const std::string& display_name) override {
        if (delimiter_) {
            return delimiter_;
        }
        std::cout << "Delimiter of " << display_name
                  << " not recognized. Please enter it ('.' is not allowed): "
                  << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return std::nullopt;
        }
        return answer;
    }

    void reportError(ErrorKind kind, const std::string& message) override {
        std::cerr << "[" << toString(kind) << "] " << message << "\n";
    }

    void renderSpectra(const view::PlotModel& model) override {
        std::cout << "\n========================================\n";
        std::cout << "Plot\n";
        std::cout << "========================================\n";
        std::cout << "x axis: " << model.x_label << "\n";
        std::cout << "y axis: " << model.y_label << "\n";

        for (const auto& series : model.series) {
            std::cout << "\n" << series.legend << ": " << series.x.size() << " points\n";
            if (!model.show_peaks) continue;

            if (series.peak_error) {
                std::cout << "  peaks: not available\n";
                continue;
            }
            std::cout << "  peaks: " << series.peaks.size() << "\n";
            for (const auto& marker : series.peaks) {
                std::cout << "    " << marker.label << "\n";
            }
        }
    }

private:
    std::optional<std::string> delimiter_;
};

void printDetails(const Spectrum& spectrum) {
    const auto details = view::describe(spectrum);

    std::cout << "\n========================================\n";
    std::cout << spectrum.displayName() << "\n";
    std::cout << "========================================\n";
    std::cout << "  Path:      " << details.path << "\n";
    std::cout << "  Title:     " << details.title << "\n";
    std::cout << "  Mode:      " << details.mode << "\n";
    std::cout << "  Date:      " << details.date << "\n";
    std::cout << "  Time:      " << details.time << "\n";
    std::cout << "  Range:     " << details.range << "\n";
    std::cout << "  Delta x:   " << details.delta_x << "\n";
    std::cout << "  Min/Max:   " << details.min_max << "\n";

    if (!details.metadata.empty()) {
        std::cout << "  Header:\n";
        for (const auto& [label, value] : details.metadata) {
            std::cout << "    " << label << ": " << value << "\n";
        }
    }
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--normalize] [--peaks] [--delimiter STR] [--verbose | --quiet] FILE...\n\n"
              << "  --normalize      scale every spectrum to 0-100 %\n"
              << "  --peaks          detect and list peaks\n"
              << "  --delimiter STR  delimiter to use when none is detected\n"
              << "  --verbose        debug output\n"
              << "  --quiet          only warnings and errors\n";
}

} // namespace

int main(int argc, char* argv[]) {
    view::ViewFlags flags;
    std::optional<std::string> delimiter;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--normalize") {
            flags.normalize = true;
        } else if (arg == "--peaks") {
            flags.show_peaks = true;
        } else if (arg == "--delimiter") {
            if (i + 1 >= argc) {
                std::cerr << "--delimiter needs a value\n";
                return 2;
            }
            delimiter = argv[++i];
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "--quiet") {
            spdlog::set_level(spdlog::level::warn);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        SpectrumCollection collection;
        ConsoleShell shell(delimiter);
        Importer importer(collection, shell);

        ImportSummary summary = importer.importFiles(files);
        for (const auto& spectrum : collection) {
            printDetails(spectrum);
        }
        importer.refreshView(flags);

        if (summary.imported.empty() && !summary.failed.empty()) {
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::critical("unexpected error: {}", e.what());
        std::cerr << "An unexpected error occurred: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
