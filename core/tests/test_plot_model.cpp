#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "specread/view/plot_model.hpp"
#include "specread/view/details.hpp"

using namespace specread;
using namespace specread::view;
using Catch::Approx;

namespace {

Spectrum makeSpectrum(const std::string& path, const std::string& mode, int points) {
    std::vector<Wavelength> wl;
    std::vector<Intensity> y;
    for (int i = 0; i < points; ++i) {
        wl.push_back(400.0 + i);
        y.push_back(5.0 - 0.5 * (i - 17) * (i - 17));
    }
    SpectrumHeader header;
    header.mode = mode;
    return Spectrum(path, wl, y, header);
}

} // namespace

TEST_CASE("Plot axis labels", "[plot_model]") {
    SpectrumCollection collection;

    SECTION("Empty collection") {
        PlotModel model = buildPlot(collection, {});
        REQUIRE(model.series.empty());
        REQUIRE(model.x_label == "Wavelength λ in nm");
        REQUIRE(model.y_label.empty());
        REQUIRE_FALSE(model.units_mismatch);
    }

    SECTION("Uniform units") {
        collection.add(makeSpectrum("a.txt", "%T", 40));
        collection.add(makeSpectrum("b.txt", "%T", 40));

        PlotModel model = buildPlot(collection, {});
        REQUIRE(model.units_uniform);
        REQUIRE(model.y_label == "Transmission in %");
        REQUIRE(model.series.size() == 2);
        REQUIRE(model.series[0].legend == "a");
    }

    SECTION("Uniform units, normalized") {
        collection.add(makeSpectrum("a.txt", "INTENSITY", 40));

        ViewFlags flags;
        flags.normalize = true;
        PlotModel model = buildPlot(collection, flags);
        REQUIRE(model.y_label == "Normalized Intensity I in %");
        REQUIRE(model.series[0].y[17] == Approx(100.0));
    }

    SECTION("Different units") {
        collection.add(makeSpectrum("a.txt", "%T", 40));
        collection.add(makeSpectrum("b.txt", "A", 40));

        PlotModel model = buildPlot(collection, {});
        REQUIRE_FALSE(model.units_uniform);
        REQUIRE(model.units_mismatch);
        REQUIRE(model.y_label == "Warning: different units.");
    }

    SECTION("Different units, normalized") {
        collection.add(makeSpectrum("a.txt", "%T", 40));
        collection.add(makeSpectrum("b.txt", "A", 40));

        ViewFlags flags;
        flags.normalize = true;
        PlotModel model = buildPlot(collection, flags);
        REQUIRE_FALSE(model.units_mismatch);
        REQUIRE(model.y_label == "Warning: different units (normalized to 100 %)");
    }
}

TEST_CASE("Plot peaks", "[plot_model]") {
    SpectrumCollection collection;
    ViewFlags flags;
    flags.show_peaks = true;

    SECTION("Markers") {
        collection.add(makeSpectrum("a.txt", "A", 40));
        PlotModel model = buildPlot(collection, flags);

        const auto& series = model.series[0];
        REQUIRE_FALSE(series.peak_error.has_value());
        REQUIRE(series.peaks.size() == 1);

        const auto& marker = series.peaks[0];
        REQUIRE(marker.x == Approx(417.0));
        REQUIRE(marker.y == Approx(5.0));
        REQUIRE(marker.annotation_y == Approx(5.0));
        REQUIRE(marker.stem_base == Approx(collection[0].yMin()));
        REQUIRE(marker.annotation_offset_px == 10);
        REQUIRE(marker.label == "(417.0|5.0)");
    }

    SECTION("Stem base stays raw when normalized") {
        collection.add(makeSpectrum("a.txt", "A", 40));
        flags.normalize = true;
        PlotModel model = buildPlot(collection, flags);

        const auto& marker = model.series[0].peaks.at(0);
        REQUIRE(marker.y == Approx(100.0));
        REQUIRE(marker.stem_base == Approx(collection[0].yMin()));
        REQUIRE(marker.label == "417.0 nm");
    }

    SECTION("Short series does not stop the batch") {
        collection.add(makeSpectrum("short.txt", "A", 10));
        collection.add(makeSpectrum("long.txt", "A", 40));

        PlotModel model = buildPlot(collection, flags);
        REQUIRE(model.series.size() == 2);

        REQUIRE(model.series[0].peak_error.has_value());
        REQUIRE(model.series[0].peaks.empty());
        REQUIRE(model.series[0].x.size() == 10);

        REQUIRE_FALSE(model.series[1].peak_error.has_value());
        REQUIRE(model.series[1].peaks.size() == 1);
    }

    SECTION("No detection without the flag") {
        collection.add(makeSpectrum("short.txt", "A", 10));
        PlotModel model = buildPlot(collection, {});
        REQUIRE_FALSE(model.series[0].peak_error.has_value());
        REQUIRE(model.series[0].peaks.empty());
    }
}

TEST_CASE("Spectrum details", "[plot_model]") {
    SECTION("Regular spectrum") {
        SpectrumHeader header;
        header.title = "Probe";
        header.mode = "%T";
        header.metadata = {MetadataPair("Name", "Probe")};
        Spectrum spec("/data/probe.txt", {500.0, 500.5, 501.0}, {10.0, 80.5, 40.0}, header);

        SpectrumDetails d = describe(spec);
        REQUIRE(d.path == "/data/probe.txt");
        REQUIRE(d.title == "Probe");
        REQUIRE(d.mode == "%T");
        REQUIRE(d.date == "Unknown");
        REQUIRE(d.range == "500.0 nm to 501.0 nm");
        REQUIRE(d.delta_x == "0.5");
        REQUIRE(d.min_max == "10.0/80.5 %");
        REQUIRE(d.metadata.size() == 1);
    }

    SECTION("Undefined statistics") {
        Spectrum spec("nan.txt", {500.0}, {kMissingIntensity});
        SpectrumDetails d = describe(spec);
        REQUIRE(d.delta_x == "undefined");
        REQUIRE(d.min_max == "undefined");
        REQUIRE(d.range == "500.0 nm to 500.0 nm");
    }
}
