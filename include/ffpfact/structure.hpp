#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ffpfact {

struct Site {
    int atomicNumber = 0;
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    // Scalar properties attached after prediction, keyed by precursor name
    std::map<std::string, double> properties;
};

// Ordered set of sites with a precomputed, periodicity-aware distance matrix.
// The geometry is fixed at construction; only site properties and external
// feature blocks may be attached afterwards.
class Structure {
private:
    std::string name;
    std::vector<Site> sites;
    std::optional<Eigen::Matrix3d> lattice;
    Eigen::MatrixXd distances;
    std::map<std::string, Eigen::MatrixXd> siteFeatures;

    void validate() const;

public:
    // Validates that the distance matrix is n x n, symmetric, finite, non-negative with a zero diagonal
    Structure(std::string name, std::vector<Site> sites, Eigen::MatrixXd distanceMatrix,
              std::optional<Eigen::Matrix3d> lattice = std::nullopt);

    // Finite structure: distances are plain Cartesian distances between positions
    static Structure fromPositions(std::string name, std::vector<Site> sites);

    static Structure fromJSON(const std::string& json, const std::string& fallbackName = "structure");
    static Structure fromFile(const std::string& path);
    std::string toJSON() const;
    void writeJSON(const std::string& path) const;

    const std::string& getName() const { return name; }
    std::size_t size() const { return sites.size(); }
    bool isPeriodic() const { return lattice.has_value(); }
    const std::optional<Eigen::Matrix3d>& getLattice() const { return lattice; }

    const Site& site(std::size_t index) const;
    const std::vector<Site>& getSites() const { return sites; }
    std::vector<int> getAtomicNumbers() const;
    int atomicNumber(std::size_t index) const { return sites[index].atomicNumber; }

    const Eigen::MatrixXd& distanceMatrix() const { return distances; }
    double distance(std::size_t i, std::size_t j) const { return distances(i, j); }

    // Deterministic over species, positions and lattice; used as a memoization key
    std::uint64_t identityHash() const;
    bool sameGeometry(const Structure& other) const;

    // Attaches one value per site; throws when the length does not match the site count
    void setSiteProperty(const std::string& property, const Eigen::VectorXd& values);

    void setSiteFeatures(const std::string& block, Eigen::MatrixXd values);
    bool hasSiteFeatures(const std::string& block) const;
    const Eigen::MatrixXd& getSiteFeatures(const std::string& block) const;
};

} // namespace ffpfact
