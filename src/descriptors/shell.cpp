#include "ffpfact/descriptors/shell.hpp"
#include "ffpfact/structure.hpp"
#include "ffpfact/utils.hpp"

#include <set>

namespace ffpfact {
namespace descriptors {

namespace {

    struct ShellSummary {
        double count = 0.0;
        double ionizationEnergy = 0.0;
        double electronegativity = 0.0;
        double distance = 0.0;
    };

    template<typename Container>
    ShellSummary summarize(const Container& members, const Structure& structure, const BondGraph& graph,
                           const ElementalPropertyTable& table, std::size_t site) {
        ShellSummary summary;
        const auto origin = static_cast<Eigen::Index>(site);
        for (std::size_t member : members) {
            const auto& props = table.get(structure.atomicNumber(member));
            summary.ionizationEnergy += props.ionizationEnergy;
            summary.electronegativity += props.electronegativity;
            summary.distance += graph.distances(origin, static_cast<Eigen::Index>(member));
        }
        summary.count = static_cast<double>(members.size());
        summary.ionizationEnergy /= summary.count;
        summary.electronegativity /= summary.count;
        summary.distance /= summary.count;
        return summary;
    }

} // anonymous namespace

SiteDescriptor ShellDescriptorCalculator::describeSite(const Structure& structure, const BondGraph& graph,
                                                       std::size_t site) const {
    if (graph.size() != structure.size()) {
        throw DescriptorException("Structure '" + structure.getName() + "': bond graph has " +
                                  std::to_string(graph.size()) + " sites, structure has " +
                                  std::to_string(structure.size()), ErrorCode::INVALID_ARGUMENT);
    }
    if (site >= structure.size()) {
        throw DescriptorException("Site index " + std::to_string(site) + " out of range",
                                  ErrorCode::INVALID_ARGUMENT);
    }

    const auto& self = table.get(structure.atomicNumber(site));

    const std::vector<std::size_t> firstShell = graph.neighbors(site);
    if (firstShell.empty()) {
        throw EmptyShellError("Structure '" + structure.getName() + "', site " + std::to_string(site) +
                              ": no bonded neighbours", site, 1);
    }

    std::set<std::size_t> secondShell;
    for (std::size_t neighbor : firstShell) {
        for (std::size_t next : graph.neighbors(neighbor)) {
            secondShell.insert(next);
        }
    }
    for (std::size_t neighbor : firstShell) {
        secondShell.erase(neighbor);
    }
    secondShell.erase(site);
    if (secondShell.empty()) {
        throw EmptyShellError("Structure '" + structure.getName() + "', site " + std::to_string(site) +
                              ": empty second neighbour shell", site, 2);
    }

    const ShellSummary first = summarize(firstShell, structure, graph, table, site);
    const ShellSummary second = summarize(secondShell, structure, graph, table, site);

    return SiteDescriptor{
        self.ionizationEnergy, self.electronegativity,
        first.count, first.ionizationEnergy, first.electronegativity, first.distance,
        second.count, second.ionizationEnergy, second.electronegativity, second.distance
    };
}

std::vector<SiteDescriptor> ShellDescriptorCalculator::describe(const Structure& structure,
                                                                const BondGraph& graph) const {
    std::vector<SiteDescriptor> result;
    result.reserve(structure.size());
    for (std::size_t i = 0; i < structure.size(); ++i) {
        result.push_back(describeSite(structure, graph, i));
    }
    return result;
}

std::vector<std::string> ShellDescriptorCalculator::featureLabels() {
    return {
        "site_ionization_energy", "site_electronegativity",
        "shell1_count", "shell1_mean_ionization_energy", "shell1_mean_electronegativity", "shell1_mean_distance",
        "shell2_count", "shell2_mean_ionization_energy", "shell2_mean_electronegativity", "shell2_mean_distance"
    };
}

} // namespace descriptors
} // namespace ffpfact
