#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace ffpfact {
class Structure;

namespace descriptors {

// Pairs at or beyond this distance are never bonded, whatever the radii
constexpr double BOND_PREFILTER_CUTOFF = 6.1;
constexpr double DEFAULT_BOND_TOLERANCE = 0.5;

struct BondGraph {
    Eigen::MatrixXi adjacency;  // symmetric 0/1, zero diagonal
    Eigen::MatrixXd distances;  // the input distance matrix, unchanged

    std::size_t size() const { return static_cast<std::size_t>(adjacency.rows()); }
    bool bonded(std::size_t i, std::size_t j) const {
        return adjacency(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) != 0;
    }
    std::vector<std::size_t> neighbors(std::size_t site) const;
};

// Bond (i, j) exists iff d(i, j) < 6.1 and d(i, j) < r_cov(Z_i) + r_cov(Z_j) + tolerance.
// Throws UnknownSpeciesError when a species has no covalent radius.
BondGraph buildBondGraph(const Eigen::MatrixXd& distances, const std::vector<int>& atomicNumbers,
                         double tolerance = DEFAULT_BOND_TOLERANCE);

BondGraph buildBondGraph(const Structure& structure, double tolerance = DEFAULT_BOND_TOLERANCE);

} // namespace descriptors
} // namespace ffpfact
