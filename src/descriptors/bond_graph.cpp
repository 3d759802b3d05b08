#include "ffpfact/descriptors/bond_graph.hpp"
#include "ffpfact/descriptors/element_properties.hpp"
#include "ffpfact/structure.hpp"
#include "ffpfact/utils.hpp"

#include <cmath>
#include <unordered_map>

namespace ffpfact {
namespace descriptors {

std::vector<std::size_t> BondGraph::neighbors(std::size_t site) const {
    std::vector<std::size_t> result;
    const auto row = static_cast<Eigen::Index>(site);
    for (Eigen::Index j = 0; j < adjacency.cols(); ++j) {
        if (adjacency(row, j) != 0) {
            result.push_back(static_cast<std::size_t>(j));
        }
    }
    return result;
}

BondGraph buildBondGraph(const Eigen::MatrixXd& distances, const std::vector<int>& atomicNumbers,
                         double tolerance) {
    const auto n = static_cast<Eigen::Index>(atomicNumbers.size());
    if (distances.rows() != n || distances.cols() != n) {
        throw DescriptorException("Distance matrix shape does not match the number of sites",
                                  ErrorCode::INVALID_ARGUMENT);
    }
    if (!(tolerance >= 0.0) || !std::isfinite(tolerance)) {
        throw DescriptorException("Bond tolerance must be a non-negative number, got " +
                                  std::to_string(tolerance), ErrorCode::INVALID_ARGUMENT);
    }

    // Resolve every radius up front so an unknown species fails even when it has no close neighbour
    std::unordered_map<int, double> radii;
    std::vector<double> siteRadius(atomicNumbers.size());
    for (std::size_t i = 0; i < atomicNumbers.size(); ++i) {
        int z = atomicNumbers[i];
        auto it = radii.find(z);
        if (it == radii.end()) {
            it = radii.emplace(z, covalentRadius(z)).first;
        }
        siteRadius[i] = it->second;
    }

    BondGraph graph;
    graph.adjacency = Eigen::MatrixXi::Zero(n, n);
    graph.distances = distances;

    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const double d = distances(i, j);
            if (d >= BOND_PREFILTER_CUTOFF) {
                continue;
            }
            const double maxDistance = siteRadius[i] + siteRadius[j] + tolerance;
            if (d < maxDistance) {
                graph.adjacency(i, j) = 1;
                graph.adjacency(j, i) = 1; // Undirected graph
            }
        }
    }
    graph.adjacency.diagonal().setZero();
    return graph;
}

BondGraph buildBondGraph(const Structure& structure, double tolerance) {
    BondGraph graph = buildBondGraph(structure.distanceMatrix(), structure.getAtomicNumbers(), tolerance);
    globalLogger.debug("Structure '" + structure.getName() + "': " +
                       std::to_string(graph.adjacency.sum() / 2) + " bonds with tolerance " +
                       std::to_string(tolerance));
    return graph;
}

} // namespace descriptors
} // namespace ffpfact
