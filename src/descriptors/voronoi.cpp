#include "ffpfact/descriptors/voronoi.hpp"
#include "ffpfact/utils.hpp"

#include <array>
#include <cmath>

namespace ffpfact {
namespace descriptors {

std::string facetWeightName(FacetWeight weight) {
    switch (weight) {
        case FacetWeight::SolidAngle: return "solid_angle";
        case FacetWeight::Area: return "area";
        case FacetWeight::Volume: return "volume";
        case FacetWeight::FaceDist: return "face_dist";
    }
    throw DescriptorException("Unhandled facet weight", ErrorCode::INVALID_ARGUMENT);
}

FacetWeight parseFacetWeight(const std::string& name) {
    if (name == "solid_angle") return FacetWeight::SolidAngle;
    if (name == "area") return FacetWeight::Area;
    if (name == "volume") return FacetWeight::Volume;
    if (name == "face_dist") return FacetWeight::FaceDist;
    throw DescriptorException("Unknown facet weight '" + name +
                              "' (expected solid_angle, area, volume or face_dist)",
                              ErrorCode::INVALID_ARGUMENT);
}

double facetWeight(const FacetRecord& facet, FacetWeight weight) {
    switch (weight) {
        case FacetWeight::SolidAngle: return facet.solidAngle;
        case FacetWeight::Area: return facet.area;
        case FacetWeight::Volume: return facet.volume;
        case FacetWeight::FaceDist: return facet.faceDist;
    }
    throw DescriptorException("Unhandled facet weight", ErrorCode::INVALID_ARGUMENT);
}

void VoronoiOptions::validate() const {
    if (volumeStats.empty() || areaStats.empty() || distanceStats.empty()) {
        throw DescriptorException("Voronoi volume, area and distance statistics must not be empty",
                                  ErrorCode::INVALID_ARGUMENT);
    }
}

PolyhedronFingerprintCalculator::PolyhedronFingerprintCalculator(const VoronoiOptions& options)
    : options(options) {
    this->options.validate();
}

std::vector<double> PolyhedronFingerprintCalculator::fingerprint(const std::vector<FacetRecord>& facets,
                                                                 std::size_t site) const {
    std::array<double, VORONOI_BINS> histogram{};
    std::array<double, VORONOI_BINS> weighted{};
    std::vector<double> volumes;
    std::vector<double> areas;
    std::vector<double> distances;
    volumes.reserve(facets.size());
    areas.reserve(facets.size());
    distances.reserve(facets.size());

    for (const auto& facet : facets) {
        if (facet.nVerts < MIN_FACET_VERTICES) {
            throw SiteError("site " + std::to_string(site) + ": facet with " +
                            std::to_string(facet.nVerts) + " vertices", ErrorCode::PARSE_ERROR, site);
        }
        if (facet.nVerts > MAX_FACET_VERTICES) {
            continue;
        }
        const std::size_t bin = static_cast<std::size_t>(facet.nVerts - MIN_FACET_VERTICES);
        histogram[bin] += 1.0;
        if (options.useWeights) {
            weighted[bin] += facetWeight(facet, options.weightField);
        }
        volumes.push_back(facet.volume);
        areas.push_back(facet.area);
        distances.push_back(2.0 * facet.faceDist);
    }

    double total = 0.0;
    for (double count : histogram) total += count;
    if (total == 0.0) {
        throw DegenerateTessellationError("site " + std::to_string(site) +
                                          ": no Voronoi facet with 3 to 10 edges", site);
    }

    std::vector<double> result;
    result.reserve(featureCount());
    result.insert(result.end(), histogram.begin(), histogram.end());
    for (double count : histogram) {
        result.push_back(count / total);
    }

    if (options.useWeights) {
        double weightTotal = 0.0;
        for (double w : weighted) weightTotal += w;
        if (weightTotal == 0.0 || !std::isfinite(weightTotal)) {
            throw DegenerateTessellationError("site " + std::to_string(site) + ": " +
                                              facetWeightName(options.weightField) +
                                              " weights sum to " + std::to_string(weightTotal), site);
        }
        for (double w : weighted) {
            result.push_back(w / weightTotal);
        }
    }

    double volumeSum = 0.0;
    for (double v : volumes) volumeSum += v;
    double areaSum = 0.0;
    for (double a : areas) areaSum += a;
    result.push_back(volumeSum);
    result.push_back(areaSum);

    for (Statistic stat : options.volumeStats) {
        result.push_back(computeStatistic(stat, volumes));
    }
    for (Statistic stat : options.areaStats) {
        result.push_back(computeStatistic(stat, areas));
    }
    for (Statistic stat : options.distanceStats) {
        result.push_back(computeStatistic(stat, distances));
    }
    return result;
}

std::vector<std::string> PolyhedronFingerprintCalculator::featureLabels() const {
    std::vector<std::string> labels;
    labels.reserve(featureCount());
    for (int i = MIN_FACET_VERTICES; i <= MAX_FACET_VERTICES; ++i) {
        labels.push_back("Voro_index_" + std::to_string(i));
    }
    for (int i = MIN_FACET_VERTICES; i <= MAX_FACET_VERTICES; ++i) {
        labels.push_back("Symmetry_index_" + std::to_string(i));
    }
    if (options.useWeights) {
        for (int i = MIN_FACET_VERTICES; i <= MAX_FACET_VERTICES; ++i) {
            labels.push_back("Symmetry_weighted_index_" + std::to_string(i));
        }
    }
    labels.emplace_back("Voro_vol_sum");
    labels.emplace_back("Voro_area_sum");
    for (Statistic stat : options.volumeStats) {
        labels.push_back("Voro_vol_" + statisticName(stat));
    }
    for (Statistic stat : options.areaStats) {
        labels.push_back("Voro_area_" + statisticName(stat));
    }
    for (Statistic stat : options.distanceStats) {
        labels.push_back("Voro_dist_" + statisticName(stat));
    }
    return labels;
}

std::size_t PolyhedronFingerprintCalculator::featureCount() const {
    return VORONOI_BINS * (options.useWeights ? 3 : 2) + 2 +
           options.volumeStats.size() + options.areaStats.size() + options.distanceStats.size();
}

} // namespace descriptors
} // namespace ffpfact
