#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "specread/spectrum.hpp"
#include <cmath>
#include <limits>

using namespace specread;
using Catch::Approx;

TEST_CASE("Spectrum construction", "[spectrum]") {
    SECTION("Construction with data") {
        std::vector<Wavelength> wl = {500.0, 501.0, 502.0};
        std::vector<Intensity> intensity = {0.1, 0.5, 0.2};

        Spectrum spec("/data/sample.txt", wl, intensity);
        REQUIRE(spec.size() == 3);
        REQUIRE(spec.wavelengthAt(0) == Approx(500.0));
        REQUIRE(spec.intensityAt(1) == Approx(0.5));
        REQUIRE(spec.sourcePath() == "/data/sample.txt");
    }

    SECTION("Mismatched array sizes throw") {
        std::vector<Wavelength> wl = {500.0, 501.0};
        std::vector<Intensity> intensity = {0.1};

        REQUIRE_THROWS_AS(Spectrum("a.txt", wl, intensity), std::invalid_argument);
    }

    SECTION("Empty series is a format error") {
        REQUIRE_THROWS_AS(Spectrum("a.txt", {}, {}), FormatError);
    }

    SECTION("Missing header fields keep their defaults") {
        Spectrum spec("a.txt", {500.0}, {1.0});
        REQUIRE(spec.title() == "Unknown");
        REQUIRE(spec.date() == "Unknown");
        REQUIRE(spec.time() == "Unknown");
        REQUIRE(spec.modeCode() == "unknown units");
        REQUIRE(spec.metadata().empty());
        REQUIRE(spec.unit() == UnitLabel("", "", "unknown units"));
    }
}

TEST_CASE("Spectrum names", "[spectrum]") {
    Spectrum spec("/measurements/2023/sample.txt", {500.0}, {1.0});

    SECTION("Display name is the base name") {
        REQUIRE(spec.displayName() == "sample.txt");
    }

    SECTION("Legend label drops .txt") {
        REQUIRE(spec.legendLabel() == "sample");
    }

    SECTION("Other extensions are kept") {
        Spectrum csv("run.csv", {500.0}, {1.0});
        REQUIRE(csv.legendLabel() == "run.csv");
    }

    SECTION("displayNameFor without directory") {
        REQUIRE(Spectrum::displayNameFor("plain.txt") == "plain.txt");
    }
}

TEST_CASE("Spectrum statistics", "[spectrum]") {
    std::vector<Wavelength> wl = {700.0, 699.5, 699.0, 698.5};
    std::vector<Intensity> intensity = {0.3, 1.2, kMissingIntensity, -0.4};

    SpectrumHeader header;
    header.mode = "A";
    Spectrum spec("desc.txt", wl, intensity, header);

    SECTION("Wavelength range follows source order") {
        REQUIRE(spec.xMin() == Approx(700.0));
        REQUIRE(spec.xMax() == Approx(698.5));
    }

    SECTION("Spacing of the first two points") {
        REQUIRE(spec.deltaX().has_value());
        REQUIRE(*spec.deltaX() == Approx(-0.5));
    }

    SECTION("Intensity range ignores NaN") {
        REQUIRE(spec.yMin() == Approx(-0.4));
        REQUIRE(spec.yMax() == Approx(1.2));
    }

    SECTION("Unit is resolved from the mode") {
        REQUIRE(spec.unit().quantity == "Extinction E");
        REQUIRE(spec.unit().text() == "Extinction E");
    }
}

TEST_CASE("Spectrum edge cases", "[spectrum]") {
    SECTION("Single point has no spacing") {
        Spectrum spec("one.txt", {500.0}, {2.0});
        REQUIRE_FALSE(spec.deltaX().has_value());
        REQUIRE(spec.xMin() == spec.xMax());
        REQUIRE(spec.yMin() == Approx(2.0));
    }

    SECTION("Infinite intensities") {
        const double inf = std::numeric_limits<double>::infinity();
        Spectrum up("up.txt", {500.0, 501.0, 502.0}, {inf, kMissingIntensity, inf});
        REQUIRE(up.yMin() == inf);
        REQUIRE(up.yMax() == inf);

        Spectrum down("down.txt", {500.0, 501.0}, {-inf, -inf});
        REQUIRE(down.yMin() == -inf);
        REQUIRE(down.yMax() == -inf);
    }

    SECTION("All NaN intensities leave the range undefined") {
        Spectrum spec("nan.txt", {500.0, 501.0},
                      {kMissingIntensity, kMissingIntensity});
        REQUIRE_FALSE(spec.intensityRange().has_value());
        REQUIRE_THROWS_AS(spec.yMin(), DegenerateDataError);
        REQUIRE_THROWS_AS(spec.yMax(), DegenerateDataError);
        REQUIRE(std::isnan(spec.intensityAt(0)));
    }
}
