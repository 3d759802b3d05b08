#pragma once

#include "ffpfact/descriptors/statistics.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ffpfact {
namespace descriptors {

constexpr int MIN_FACET_VERTICES = 3;
constexpr int MAX_FACET_VERTICES = 10;
constexpr std::size_t VORONOI_BINS = MAX_FACET_VERTICES - MIN_FACET_VERTICES + 1;
constexpr double DEFAULT_TESSELLATION_CUTOFF = 6.5;

// One facet of the Voronoi polyhedron around a site, as reported by the tessellation engine
struct FacetRecord {
    int nVerts = 0;
    double volume = 0.0;     // volume of the sub-polyhedron spanned by the facet and the centre
    double area = 0.0;
    double faceDist = 0.0;   // centre to facet plane; half the neighbour distance
    double solidAngle = 0.0;
};

enum class FacetWeight {
    SolidAngle,
    Area,
    Volume,
    FaceDist
};

std::string facetWeightName(FacetWeight weight);
FacetWeight parseFacetWeight(const std::string& name);
double facetWeight(const FacetRecord& facet, FacetWeight weight);

struct VoronoiOptions {
    bool useWeights = false;
    FacetWeight weightField = FacetWeight::SolidAngle;
    std::vector<Statistic> volumeStats = defaultStatistics();
    std::vector<Statistic> areaStats = defaultStatistics();
    std::vector<Statistic> distanceStats = defaultStatistics();

    // Throws DescriptorException(INVALID_ARGUMENT) when a statistic list is empty
    void validate() const;
};

/**
 * Turns the facets of one Voronoi polyhedron into a fixed-length fingerprint:
 *   Voronoi indices (facet counts by edge number 3..10)
 *   i-fold symmetry indices (counts normalised to sum 1)
 *   weighted symmetry indices, when enabled
 *   total volume and total area
 *   volume, area and neighbour distance statistics
 *
 * Facets with more than 10 edges are left out of every quantity.
 */
class PolyhedronFingerprintCalculator {
private:
    VoronoiOptions options;

public:
    explicit PolyhedronFingerprintCalculator(const VoronoiOptions& options = VoronoiOptions());

    // site is only used to tag errors. Throws DegenerateTessellationError when no facet
    // has between 3 and 10 edges (or the weights sum to zero), and SiteError(PARSE_ERROR)
    // for facets with fewer than 3 edges.
    std::vector<double> fingerprint(const std::vector<FacetRecord>& facets, std::size_t site = 0) const;

    std::vector<std::string> featureLabels() const;
    std::size_t featureCount() const;

    const VoronoiOptions& getOptions() const { return options; }
};

} // namespace descriptors
} // namespace ffpfact
