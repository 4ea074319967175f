#include <catch2/catch_test_macros.hpp>
#include "specread/units.hpp"
#include "specread/errors.hpp"

using namespace specread;

TEST_CASE("Unit resolution", "[units]") {
    SECTION("Transmission") {
        UnitLabel unit = resolveUnit("%T");
        REQUIRE(unit.quantity == "Transmission");
        REQUIRE(unit.separator == " in ");
        REQUIRE(unit.symbol == "%");
        REQUIRE(unit.text() == "Transmission in %");
    }

    SECTION("Intensity") {
        REQUIRE(resolveUnit("INTENSITY") == UnitLabel("Intensity I", " in ", "a.u."));
    }

    SECTION("Extinction has no symbol") {
        REQUIRE(resolveUnit("A") == UnitLabel("Extinction E", "", ""));
        REQUIRE(resolveUnit("E") == resolveUnit("A"));
    }

    SECTION("Unknown codes pass through") {
        UnitLabel unit = resolveUnit("XYZ");
        REQUIRE(unit == UnitLabel("", "", "XYZ"));
        REQUIRE(unit.text() == "XYZ");
    }

    SECTION("Matching is case-sensitive") {
        REQUIRE(resolveUnit("%t") == UnitLabel("", "", "%t"));
        REQUIRE(resolveUnit("intensity").quantity.empty());
    }
}

TEST_CASE("Error kinds", "[units]") {
    SECTION("Errors carry their kind") {
        REQUIRE(FormatError("x").kind() == ErrorKind::FORMAT);
        REQUIRE(IoError("x").kind() == ErrorKind::IO);
        REQUIRE(DegenerateDataError("x").kind() == ErrorKind::DEGENERATE_DATA);

        DuplicateNameError dup("a.txt");
        REQUIRE(dup.kind() == ErrorKind::DUPLICATE_NAME);
        REQUIRE(dup.name() == "a.txt");

        SeriesTooShortError shortErr(10, 31);
        REQUIRE(shortErr.kind() == ErrorKind::SERIES_TOO_SHORT);
        REQUIRE(shortErr.points() == 10);
        REQUIRE(shortErr.window() == 31);
    }

    SECTION("Kind names") {
        REQUIRE(toString(ErrorKind::UNITS_MISMATCH) == "units mismatch");
        REQUIRE(toString(ErrorKind::FORMAT) == "format error");
    }
}
