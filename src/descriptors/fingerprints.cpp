#include "ffpfact/descriptors/fingerprints.hpp"
#include "ffpfact/structure.hpp"
#include "ffpfact/utils.hpp"

#include <cmath>
#include <cstdio>
#include <optional>
#include <utility>

#ifdef FFPFACT_WITH_TBB
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#endif

namespace ffpfact {
namespace descriptors {

namespace {

    bool isSiteLocal(ErrorCode code) {
        return code == ErrorCode::EMPTY_SHELL || code == ErrorCode::DEGENERATE_TESSELLATION;
    }

    // Runs computeRow(site) for every site and stores the rows in result.values.
    // Site-local errors are collected, everything else propagates.
    template<typename RowFunc>
    void computeSites(std::size_t numSites, BlockResult& result, RowFunc computeRow) {
        std::vector<std::optional<SiteFailure>> failures(numSites);

        auto runSite = [&](std::size_t i) {
            try {
                const std::vector<double> row = computeRow(i);
                for (std::size_t k = 0; k < row.size(); ++k) {
                    result.values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(k)) = row[k];
                }
            } catch (const SiteError& e) {
                if (!isSiteLocal(e.getCode())) throw;
                failures[i] = SiteFailure{i, e.getCode(), e.what(), std::current_exception()};
            }
        };

#ifdef FFPFACT_WITH_TBB
        if (globalConfig.numThreads > 1 && numSites > 1) {
            tbb::parallel_for(tbb::blocked_range<std::size_t>(0, numSites),
                [&](const tbb::blocked_range<std::size_t>& range) {
                    for (std::size_t i = range.begin(); i != range.end(); ++i) {
                        runSite(i);
                    }
                }
            );
        } else
#endif
        { // Single-threaded loop
            for (std::size_t i = 0; i < numSites; ++i) {
                runSite(i);
            }
        }

        for (auto& failure : failures) {
            if (failure) {
                result.failures.push_back(std::move(*failure));
            }
        }
    }

    std::vector<std::string> agniLabels() {
        std::vector<std::string> labels;
        for (int k = 0; k < 8; ++k) {
            // eta spaced logarithmically from 0.8 to 16
            const double eta = 0.8 * std::pow(20.0, k / 7.0);
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "AGNI eta=%.2e", eta);
            labels.emplace_back(buffer);
        }
        return labels;
    }

    std::vector<std::string> crystalNNLabels() {
        std::vector<std::string> labels;
        for (int cn = 1; cn <= 24; ++cn) {
            labels.push_back("wt CN_" + std::to_string(cn));
        }
        return labels;
    }

    std::vector<std::string> opSiteLabels() {
        return {
            "sgl_bd CN_1",
            "L-shaped CN_2", "water-like CN_2", "bent 120 degrees CN_2", "bent 150 degrees CN_2",
            "linear CN_2",
            "trigonal planar CN_3", "trigonal non-coplanar CN_3", "T-shaped CN_3",
            "square co-planar CN_4", "tetrahedral CN_4", "rectangular see-saw-like CN_4",
            "see-saw-like CN_4", "trigonal pyramidal CN_4",
            "pentagonal planar CN_5", "square pyramidal CN_5", "trigonal bipyramidal CN_5",
            "hexagonal planar CN_6", "octahedral CN_6", "pentagonal pyramidal CN_6",
            "hexagonal pyramidal CN_7", "pentagonal bipyramidal CN_7",
            "body-centered cubic CN_8", "hexagonal bipyramidal CN_8",
            "q2 CN_9", "q4 CN_9", "q6 CN_9",
            "q2 CN_10", "q4 CN_10", "q6 CN_10",
            "q2 CN_11", "q4 CN_11", "q6 CN_11",
            "cuboctahedral CN_12", "q2 CN_12", "q4 CN_12", "q6 CN_12"
        };
    }

} // anonymous namespace

// --- ShellFingerprint ---

ShellFingerprint::ShellFingerprint(const ElementalPropertyTable& table, double tolerance)
    : SiteFingerprint("shell", "Ionization energy, electronegativity and distance statistics of bonded shells"),
      calculator(table), tolerance(tolerance) {}

std::vector<std::string> ShellFingerprint::featureLabels() const {
    return ShellDescriptorCalculator::featureLabels();
}

BlockResult ShellFingerprint::featurize(const Structure& structure) const {
    const BondGraph graph = buildBondGraph(structure, tolerance);

    BlockResult result;
    result.values = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(structure.size()),
                                          static_cast<Eigen::Index>(SITE_DESCRIPTOR_SIZE));
    computeSites(structure.size(), result, [&](std::size_t site) {
        const SiteDescriptor descriptor = calculator.describeSite(structure, graph, site);
        return std::vector<double>(descriptor.begin(), descriptor.end());
    });
    return result;
}

// --- VoronoiFingerprint ---

VoronoiFingerprint::VoronoiFingerprint(std::shared_ptr<const TessellationProvider> tessellation,
                                       double cutoff, const VoronoiOptions& options)
    : SiteFingerprint("voronoi", "Voronoi indices, symmetry indices and facet statistics"),
      tessellation(std::move(tessellation)), cutoff(cutoff), calculator(options) {
    if (!this->tessellation) {
        throw DescriptorException("Voronoi fingerprint needs a tessellation provider", ErrorCode::INVALID_ARGUMENT);
    }
    if (!(cutoff > 0.0) || !std::isfinite(cutoff)) {
        throw DescriptorException("Tessellation cutoff must be positive, got " + std::to_string(cutoff),
                                  ErrorCode::INVALID_ARGUMENT);
    }
}

std::vector<std::string> VoronoiFingerprint::featureLabels() const {
    return calculator.featureLabels();
}

BlockResult VoronoiFingerprint::featurize(const Structure& structure) const {
    const std::shared_ptr<const SiteFacets> facets = tessellation->neighbors(structure, cutoff);
    if (!facets || facets->size() != structure.size()) {
        throw DescriptorException("Structure '" + structure.getName() +
                                  "': tessellation does not cover every site", ErrorCode::INVALID_ARGUMENT);
    }

    BlockResult result;
    result.values = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(structure.size()),
                                          static_cast<Eigen::Index>(calculator.featureCount()));
    computeSites(structure.size(), result, [&](std::size_t site) {
        try {
            return calculator.fingerprint((*facets)[site], site);
        } catch (const DegenerateTessellationError& e) {
            throw DegenerateTessellationError("Structure '" + structure.getName() + "', " + e.what(), site);
        } catch (const SiteError& e) {
            throw SiteError("Structure '" + structure.getName() + "', " + e.what(), e.getCode(), site);
        }
    });
    return result;
}

// --- PrecomputedFingerprint ---

PrecomputedFingerprint::PrecomputedFingerprint(const std::string& name, const std::string& description,
                                               std::vector<std::string> labels)
    : SiteFingerprint(name, description), labels(std::move(labels)) {}

std::unique_ptr<PrecomputedFingerprint> PrecomputedFingerprint::agni() {
    return std::make_unique<PrecomputedFingerprint>("agni", "AGNI radial fingerprint", agniLabels());
}

std::unique_ptr<PrecomputedFingerprint> PrecomputedFingerprint::crystalNN() {
    return std::make_unique<PrecomputedFingerprint>("crystal_nn", "CrystalNN coordination number fingerprint",
                                                    crystalNNLabels());
}

std::unique_ptr<PrecomputedFingerprint> PrecomputedFingerprint::opSite() {
    return std::make_unique<PrecomputedFingerprint>("op_site", "Local order parameter site fingerprint",
                                                    opSiteLabels());
}

BlockResult PrecomputedFingerprint::featurize(const Structure& structure) const {
    const Eigen::MatrixXd& values = structure.getSiteFeatures(name);
    const auto rows = static_cast<Eigen::Index>(structure.size());
    const auto cols = static_cast<Eigen::Index>(labels.size());
    if (values.rows() != rows || values.cols() != cols) {
        throw DescriptorException("Structure '" + structure.getName() + "': site feature block '" + name +
                                  "' is " + std::to_string(values.rows()) + "x" + std::to_string(values.cols()) +
                                  ", expected " + std::to_string(rows) + "x" + std::to_string(cols),
                                  ErrorCode::PARSE_ERROR);
    }
    if (!values.allFinite()) {
        throw DescriptorException("Structure '" + structure.getName() + "': site feature block '" + name +
                                  "' contains non-finite values", ErrorCode::PARSE_ERROR);
    }

    BlockResult result;
    result.values = values;
    return result;
}

} // namespace descriptors
} // namespace ffpfact
