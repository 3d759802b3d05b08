#pragma once

#include "ffpfact/structure.hpp"
#include "ffpfact/utils.hpp"
#include "ffpfact/descriptors/bond_graph.hpp"
#include "ffpfact/descriptors/voronoi.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace ffpfact {

namespace descriptors {
class ElementalPropertyTable;
class TessellationProvider;
}

// A per-site error recorded while computing one block
struct SiteFailure {
    std::size_t site = 0;
    ErrorCode code = ErrorCode::UNKNOWN_ERROR;
    std::string message;
    std::exception_ptr error;
};

struct BlockResult {
    Eigen::MatrixXd values;            // one row per site; rows of failed sites are unspecified
    std::vector<SiteFailure> failures; // sorted by site index
};

// Base class for one block of per-site features
class SiteFingerprint {
protected:
    std::string name;
    std::string description;

public:
    SiteFingerprint(const std::string& name, const std::string& description)
        : name(name), description(description) {}
    virtual ~SiteFingerprint() = default;

    const std::string& getName() const { return name; }
    const std::string& getDescription() const { return description; }

    // Column names; same length and order as the rows produced by featurize()
    virtual std::vector<std::string> featureLabels() const = 0;
    std::size_t featureCount() const { return featureLabels().size(); }

    // Site-local failures (SiteError) are reported through BlockResult::failures,
    // anything else is thrown.
    virtual BlockResult featurize(const Structure& structure) const = 0;
};

enum class SiteErrorPolicy {
    Abort, // rethrow the first per-site failure
    Skip   // drop failing sites from the matrix
};

SiteErrorPolicy parseSiteErrorPolicy(const std::string& name);

struct AssemblerOptions {
    double bondTolerance = descriptors::DEFAULT_BOND_TOLERANCE;
    double tessellationCutoff = descriptors::DEFAULT_TESSELLATION_CUTOFF;
    descriptors::VoronoiOptions voronoi;
    SiteErrorPolicy policy = SiteErrorPolicy::Abort;
};

struct FeatureMatrix {
    Eigen::MatrixXd values;               // rows follow siteIndices
    std::vector<std::string> labels;
    std::vector<std::size_t> siteIndices; // structure site of each row, ascending
    std::vector<SiteFailure> skipped;     // populated under SiteErrorPolicy::Skip

    std::size_t rows() const { return siteIndices.size(); }
    std::size_t cols() const { return labels.size(); }
};

// Concatenates feature blocks column-wise in registration order
class FeatureAssembler {
private:
    std::vector<std::unique_ptr<SiteFingerprint>> blocks;
    SiteErrorPolicy policy;

public:
    explicit FeatureAssembler(SiteErrorPolicy policy = SiteErrorPolicy::Abort);

    // AGNI, CrystalNN, shell descriptors, OP-site, Voronoi fingerprint: the column
    // layout the pretrained models were fitted on.
    static FeatureAssembler standard(const descriptors::ElementalPropertyTable& table,
                                     std::shared_ptr<const descriptors::TessellationProvider> tessellation,
                                     const AssemblerOptions& options = AssemblerOptions());

    void registerBlock(std::unique_ptr<SiteFingerprint> block);
    std::vector<std::string> getBlockNames() const;
    const SiteFingerprint* getBlock(const std::string& name) const;

    std::vector<std::string> featureLabels() const;
    std::size_t featureCount() const;

    SiteErrorPolicy getPolicy() const { return policy; }
    void setPolicy(SiteErrorPolicy newPolicy) { policy = newPolicy; }

    FeatureMatrix assemble(const Structure& structure) const;
};

} // namespace ffpfact
