#include <algorithm>

#include <catch2/catch.hpp>

#include "ffpfact/descriptors/element_properties.hpp"
#include "ffpfact/utils.hpp"

using namespace ffpfact;
using namespace ffpfact::descriptors;

TEST_CASE("builtin element table") {
    const auto& table = ElementalPropertyTable::builtin();

    CHECK(table.ionizationEnergy(6) == Approx(11.260));
    CHECK(table.electronegativity(6) == Approx(2.55));
    CHECK(table.electronegativity(9) == Approx(3.98));
    CHECK(table.contains(1));
    CHECK(table.contains(94));

    // noble gases without a Pauling electronegativity
    CHECK_FALSE(table.contains(2));
    CHECK_FALSE(table.contains(18));
    try {
        table.get(2);
        FAIL("expected an unknown species error");
    } catch (const UnknownSpeciesError& e) {
        CHECK(e.getAtomicNumber() == 2);
        CHECK(e.getCode() == ErrorCode::UNKNOWN_SPECIES);
    }

    auto numbers = table.atomicNumbers();
    CHECK(numbers.size() == table.size());
    CHECK(std::is_sorted(numbers.begin(), numbers.end()));
}

TEST_CASE("element table from JSON") {
    auto table = ElementalPropertyTable::fromJSON(R"({
        "2": {"ionization_energy": 24.587, "electronegativity": 5.5},
        "8": {"ionization_energy": 13.618, "electronegativity": 3.44}
    })");
    CHECK(table.size() == 2);
    CHECK(table.electronegativity(2) == Approx(5.5));
    CHECK_THROWS_AS(table.get(6), UnknownSpeciesError);

    SECTION("invalid tables") {
        CHECK_THROWS_AS(ElementalPropertyTable::fromJSON("[]"), DescriptorException);
        CHECK_THROWS_AS(ElementalPropertyTable::fromJSON(R"({"O": {"ionization_energy": 1, "electronegativity": 1}})"),
                        DescriptorException);
        CHECK_THROWS_AS(ElementalPropertyTable::fromJSON(R"({"200": {"ionization_energy": 1, "electronegativity": 1}})"),
                        DescriptorException);
        CHECK_THROWS_AS(ElementalPropertyTable::fromJSON(R"({"8": {"ionization_energy": 13.618}})"),
                        DescriptorException);
    }

    SECTION("missing file") {
        try {
            ElementalPropertyTable::fromFile("/nonexistent/elements.json");
            FAIL("expected an IO error");
        } catch (const DescriptorException& e) {
            CHECK(e.getCode() == ErrorCode::IO_ERROR);
        }
    }
}

TEST_CASE("periodic table lookups") {
    SECTION("Cordero covalent radii") {
        CHECK(covalentRadius(1) == 0.31);
        CHECK(covalentRadius(6) == 0.76);
        CHECK(covalentRadius(7) == 0.71);
        CHECK(covalentRadius(8) == 0.66);
        CHECK(covalentRadius(26) == 1.32);
        CHECK(covalentRadius(29) == 1.32);
        CHECK(covalentRadius(30) == 1.22);
        CHECK(covalentRadius(55) == 2.44);
        CHECK(covalentRadius(96) == 1.69);

        CHECK_THROWS_AS(covalentRadius(0), UnknownSpeciesError);
        CHECK_THROWS_AS(covalentRadius(97), UnknownSpeciesError);
        CHECK_THROWS_AS(covalentRadius(119), UnknownSpeciesError);
    }

    CHECK(atomicNumberFromSymbol("Fe") == 26);
    CHECK(elementSymbol(26) == "Fe");
    for (int z: {1, 6, 8, 29, 79}) {
        CHECK(atomicNumberFromSymbol(elementSymbol(z)) == z);
    }
    CHECK_THROWS_AS(elementSymbol(0), UnknownSpeciesError);
}
