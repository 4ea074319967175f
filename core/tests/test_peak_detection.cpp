#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "specread/algorithms/peak_detection.hpp"
#include "specread/algorithms/normalization.hpp"
#include "specread/format.hpp"
#include <cmath>

using namespace specread;
using namespace specread::algorithms;
using Catch::Approx;

namespace {

// Single maximum of 5.0 at index 17, strictly monotonic on both sides
Spectrum parabolaSpectrum() {
    std::vector<Wavelength> wl;
    std::vector<Intensity> y;
    for (int i = 0; i < 40; ++i) {
        wl.push_back(400.0 + i);
        y.push_back(5.0 - 0.5 * (i - 17) * (i - 17));
    }
    return Spectrum("parabola.txt", wl, y);
}

} // namespace

TEST_CASE("Number formatting", "[peak_detection]") {
    REQUIRE(formatNumber(500.0) == "500.0");
    REQUIRE(formatNumber(-2.0) == "-2.0");
    REQUIRE(formatNumber(0.12) == "0.12");
    REQUIRE(formatNumber(417.5) == "417.5");
}

TEST_CASE("Local maxima", "[peak_detection]") {
    SECTION("Plateau is not a peak") {
        std::vector<double> values = {0.0, 1.0, 2.0, 2.0, 2.0, 2.0, 2.0, 1.0, 0.0};
        REQUIRE(PeakDetector::findLocalMaxima(values).empty());
    }

    SECTION("End points are not peaks") {
        std::vector<double> values = {5.0, 1.0, 5.0};
        REQUIRE(PeakDetector::findLocalMaxima(values).empty());
    }

    SECTION("Strict maxima") {
        std::vector<double> values = {0.0, 3.0, 1.0, 4.0, 4.0, 2.0, 6.0, 0.0};
        auto maxima = PeakDetector::findLocalMaxima(values);
        REQUIRE(maxima.size() == 2);
        REQUIRE(maxima[0] == 1);
        REQUIRE(maxima[1] == 6);
    }

    SECTION("Too few points") {
        REQUIRE(PeakDetector::findLocalMaxima({}).empty());
        REQUIRE(PeakDetector::findLocalMaxima({1.0, 2.0}).empty());
    }
}

TEST_CASE("Peak detection", "[peak_detection]") {
    Spectrum spec = parabolaSpectrum();

    SECTION("Single interior maximum") {
        PeakList peaks = detectPeaks(spec, false);
        REQUIRE(peaks.size() == 1);
        REQUIRE(peaks[0].index() >= 16);
        REQUIRE(peaks[0].index() <= 18);
        REQUIRE(peaks[0].wavelength() == Approx(417.0));
        REQUIRE(peaks[0].intensity() == Approx(5.0));
        REQUIRE(peaks[0].label() == "(417.0|5.0)");
    }

    SECTION("Normalized labels show the wavelength only") {
        PeakList peaks = detectPeaks(spec, true);
        REQUIRE(peaks.size() == 1);
        REQUIRE(peaks[0].index() == 17);
        REQUIRE(peaks[0].intensity() == Approx(100.0));
        REQUIRE(peaks[0].label() == "417.0 nm");
    }

    SECTION("Too short for the smoothing window") {
        Spectrum small("small.txt", std::vector<Wavelength>(10, 500.0),
                       std::vector<Intensity>(10, 1.0));
        REQUIRE_THROWS_AS(detectPeaks(small, false), SeriesTooShortError);
    }

    SECTION("Mismatched arrays") {
        PeakDetector detector;
        REQUIRE_THROWS_AS(detector.detect({1.0, 2.0}, {1.0}, false), std::invalid_argument);
    }
}

TEST_CASE("Peak labels", "[peak_detection]") {
    PeakDetector detector;

    SECTION("Raw labels round the intensity") {
        REQUIRE(detector.peakLabel(500.0, 1.2345, false) == "(500.0|1.23)");
        REQUIRE(detector.peakLabel(512.5, 0.5, false) == "(512.5|0.5)");
    }

    SECTION("Exact halves round to even") {
        REQUIRE(detector.peakLabel(500.0, 0.125, false) == "(500.0|0.12)");
        REQUIRE(detector.peakLabel(500.0, 0.375, false) == "(500.0|0.38)");
    }

    SECTION("Normalized labels") {
        REQUIRE(detector.peakLabel(500.25, 87.3, true) == "500.25 nm");
    }

    SECTION("Configurable decimals") {
        PeakDetectionOptions options;
        options.label_decimals = 1;
        detector.setOptions(options);
        REQUIRE(detector.peakLabel(500.0, 1.2345, false) == "(500.0|1.2)");
    }
}

TEST_CASE("Normalization", "[peak_detection]") {
    SECTION("Scaled to 0-100") {
        std::vector<Intensity> values = {1.0, 3.0, 5.0};
        auto scaled = normalizeIntensity(values, IntensityRange(1.0, 5.0));
        REQUIRE(scaled[0] == Approx(0.0));
        REQUIRE(scaled[1] == Approx(50.0));
        REQUIRE(scaled[2] == Approx(100.0));
    }

    SECTION("Zero maximum leaves the values unchanged") {
        std::vector<Intensity> values = {-3.0, -1.0, 0.0};
        auto result = normalizeIntensity(values, IntensityRange(-3.0, 0.0));
        REQUIRE(result == values);
    }

    SECTION("Undefined range leaves the values unchanged") {
        std::vector<Intensity> values = {1.0, 2.0};
        REQUIRE(normalizeIntensity(values, std::nullopt) == values);
    }

    SECTION("NaN stays NaN") {
        Spectrum spec("gap.txt", {500.0, 501.0, 502.0}, {2.0, kMissingIntensity, 4.0});
        auto scaled = normalizedIntensity(spec);
        REQUIRE(scaled[0] == Approx(0.0));
        REQUIRE(std::isnan(scaled[1]));
        REQUIRE(scaled[2] == Approx(100.0));
    }
}
