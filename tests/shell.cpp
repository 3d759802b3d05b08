#include <cmath>

#include <catch2/catch.hpp>

#include "ffpfact/descriptors/bond_graph.hpp"
#include "ffpfact/descriptors/element_properties.hpp"
#include "ffpfact/descriptors/shell.hpp"
#include "ffpfact/utils.hpp"

#include "helpers.hpp"

using namespace ffpfact;
using namespace ffpfact::descriptors;

TEST_CASE("shell descriptors") {
    const auto& table = ElementalPropertyTable::builtin();
    auto calculator = ShellDescriptorCalculator(table);

    // C - N - O - C, only nearest neighbours are bonded
    auto chain = linear_chain({"C", "N", "O", "C"}, 1.4);
    auto graph = buildBondGraph(chain);

    SECTION("labels") {
        auto labels = ShellDescriptorCalculator::featureLabels();
        CHECK(labels.size() == SITE_DESCRIPTOR_SIZE);
        CHECK(labels[0] == "site_ionization_energy");
        CHECK(labels[2] == "shell1_count");
        CHECK(labels[6] == "shell2_count");
        CHECK(labels[9] == "shell2_mean_distance");
    }

    SECTION("end of the chain") {
        auto descriptor = calculator.describeSite(chain, graph, 0);
        CHECK(descriptor.size() == 10);

        CHECK(descriptor[0] == table.ionizationEnergy(6));
        CHECK(descriptor[1] == table.electronegativity(6));

        CHECK(descriptor[2] == 1.0);
        CHECK(descriptor[3] == table.ionizationEnergy(7));
        CHECK(descriptor[4] == table.electronegativity(7));
        CHECK(descriptor[5] == Approx(1.4));

        // second shell distances are measured from the site, not from the first shell
        CHECK(descriptor[6] == 1.0);
        CHECK(descriptor[7] == table.ionizationEnergy(8));
        CHECK(descriptor[8] == table.electronegativity(8));
        CHECK(descriptor[9] == Approx(2.8));
    }

    SECTION("middle of the chain") {
        auto descriptor = calculator.describeSite(chain, graph, 1);

        CHECK(descriptor[0] == table.ionizationEnergy(7));
        CHECK(descriptor[2] == 2.0);
        CHECK(descriptor[3] == Approx((table.ionizationEnergy(6) + table.ionizationEnergy(8)) / 2));
        CHECK(descriptor[4] == Approx((table.electronegativity(6) + table.electronegativity(8)) / 2));
        CHECK(descriptor[5] == Approx(1.4));

        CHECK(descriptor[6] == 1.0);
        CHECK(descriptor[7] == table.ionizationEnergy(6));
        CHECK(descriptor[9] == Approx(2.8));
    }

    SECTION("second shell excludes the site and the first shell") {
        // square ring: every site is bonded to two others, the opposite corner is
        // the only second neighbour
        auto ring = make_structure("ring", {"C", "C", "C", "C"}, {
            {0.0, 0.0, 0.0},
            {1.5, 0.0, 0.0},
            {1.5, 1.5, 0.0},
            {0.0, 1.5, 0.0},
        });
        auto ring_graph = buildBondGraph(ring);
        REQUIRE(ring_graph.neighbors(0) == std::vector<size_t>{1, 3});

        auto descriptor = calculator.describeSite(ring, ring_graph, 0);
        CHECK(descriptor[2] == 2.0);
        CHECK(descriptor[6] == 1.0);
        CHECK(descriptor[9] == Approx(1.5 * std::sqrt(2.0)));
    }

    SECTION("idempotent") {
        auto first = calculator.describe(chain, graph);
        auto second = calculator.describe(chain, graph);
        REQUIRE(first.size() == 4);
        CHECK(first == second);
    }
}

TEST_CASE("shell descriptor errors") {
    const auto& table = ElementalPropertyTable::builtin();
    auto calculator = ShellDescriptorCalculator(table);

    SECTION("empty first shell") {
        auto isolated = linear_chain({"C", "C"}, 5.0);
        auto graph = buildBondGraph(isolated);
        try {
            calculator.describeSite(isolated, graph, 1);
            FAIL("expected an EmptyShellError");
        } catch (const EmptyShellError& e) {
            CHECK(e.getSiteIndex() == 1);
            CHECK(e.getShell() == 1);
            CHECK(e.getCode() == ErrorCode::EMPTY_SHELL);
        }
    }

    SECTION("empty second shell") {
        auto dimer = linear_chain({"C", "C"}, 1.4);
        auto graph = buildBondGraph(dimer);
        try {
            calculator.describeSite(dimer, graph, 0);
            FAIL("expected an EmptyShellError");
        } catch (const EmptyShellError& e) {
            CHECK(e.getSiteIndex() == 0);
            CHECK(e.getShell() == 2);
        }

        // all sites bonded to each other
        auto triangle = make_structure("triangle", {"C", "C", "C"}, {
            {0.0, 0.0, 0.0},
            {1.4, 0.0, 0.0},
            {0.7, 1.2, 0.0},
        });
        auto triangle_graph = buildBondGraph(triangle);
        CHECK_THROWS_AS(calculator.describe(triangle, triangle_graph), EmptyShellError);
    }

    SECTION("element missing from the property table") {
        auto chain = linear_chain({"C", "He", "C", "C"}, 1.0);
        auto graph = buildBondGraph(chain);
        CHECK_THROWS_AS(calculator.describeSite(chain, graph, 1), UnknownSpeciesError);
    }
}
