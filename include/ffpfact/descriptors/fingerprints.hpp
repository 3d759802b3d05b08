#pragma once

#include "ffpfact/descriptors.hpp"
#include "ffpfact/descriptors/element_properties.hpp"
#include "ffpfact/descriptors/shell.hpp"
#include "ffpfact/descriptors/tessellation.hpp"
#include "ffpfact/descriptors/voronoi.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ffpfact {
namespace descriptors {

// Bond graph followed by first and second shell statistics
class ShellFingerprint : public SiteFingerprint {
private:
    ShellDescriptorCalculator calculator;
    double tolerance;

public:
    explicit ShellFingerprint(const ElementalPropertyTable& table, double tolerance = DEFAULT_BOND_TOLERANCE);

    std::vector<std::string> featureLabels() const override;
    BlockResult featurize(const Structure& structure) const override;
};

// Voronoi polyhedron fingerprint of every site
class VoronoiFingerprint : public SiteFingerprint {
private:
    std::shared_ptr<const TessellationProvider> tessellation;
    double cutoff;
    PolyhedronFingerprintCalculator calculator;

public:
    VoronoiFingerprint(std::shared_ptr<const TessellationProvider> tessellation,
                       double cutoff = DEFAULT_TESSELLATION_CUTOFF,
                       const VoronoiOptions& options = VoronoiOptions());

    double getCutoff() const { return cutoff; }
    const PolyhedronFingerprintCalculator& getCalculator() const { return calculator; }

    std::vector<std::string> featureLabels() const override;
    BlockResult featurize(const Structure& structure) const override;
};

// Per-site block computed by an external featurizer and shipped with the
// structure under Structure::getSiteFeatures(name)
class PrecomputedFingerprint : public SiteFingerprint {
private:
    std::vector<std::string> labels;

public:
    PrecomputedFingerprint(const std::string& name, const std::string& description,
                           std::vector<std::string> labels);

    // 8 radial Gaussian-weighted neighbour sums, eta from 0.8 to 16 on a log grid
    static std::unique_ptr<PrecomputedFingerprint> agni();
    // Coordination number likelihoods for CN 1..24
    static std::unique_ptr<PrecomputedFingerprint> crystalNN();
    // 37 local order parameters of the best matching coordination motifs
    static std::unique_ptr<PrecomputedFingerprint> opSite();

    std::vector<std::string> featureLabels() const override { return labels; }
    // Throws DescriptorException(PARSE_ERROR) when the block is missing, mis-shaped or not finite
    BlockResult featurize(const Structure& structure) const override;
};

} // namespace descriptors
} // namespace ffpfact
