#pragma once

#include "ffpfact/descriptors/bond_graph.hpp"
#include "ffpfact/descriptors/element_properties.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace ffpfact {
class Structure;

namespace descriptors {

constexpr std::size_t SITE_DESCRIPTOR_SIZE = 10;

// [IE, EN, |S1|, mean IE(S1), mean EN(S1), mean d(S1), |S2|, mean IE(S2), mean EN(S2), mean d(S2)]
using SiteDescriptor = std::array<double, SITE_DESCRIPTOR_SIZE>;

// Statistics of the site itself and of its first and second bonded shells.
// S1 holds the bonded neighbours of the site, S2 the neighbours of S1 that are
// neither in S1 nor the site itself. Both mean distances are measured from the site.
class ShellDescriptorCalculator {
private:
    const ElementalPropertyTable& table;

public:
    explicit ShellDescriptorCalculator(const ElementalPropertyTable& table) : table(table) {}

    // Throws EmptyShellError when either shell is empty and UnknownSpeciesError
    // when a species is missing from the property table
    SiteDescriptor describeSite(const Structure& structure, const BondGraph& graph, std::size_t site) const;

    // All sites in structure order; the first failing site aborts
    std::vector<SiteDescriptor> describe(const Structure& structure, const BondGraph& graph) const;

    static std::vector<std::string> featureLabels();
};

} // namespace descriptors
} // namespace ffpfact
