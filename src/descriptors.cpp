#include "ffpfact/descriptors.hpp"
#include "ffpfact/descriptors/fingerprints.hpp"
#include "ffpfact/descriptors/element_properties.hpp"
#include "ffpfact/descriptors/tessellation.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace ffpfact {

SiteErrorPolicy parseSiteErrorPolicy(const std::string& name) {
    if (name == "abort") return SiteErrorPolicy::Abort;
    if (name == "skip") return SiteErrorPolicy::Skip;
    throw DescriptorException("Unknown site error policy '" + name + "' (expected abort or skip)",
                              ErrorCode::INVALID_ARGUMENT);
}

// FeatureAssembler implementation
FeatureAssembler::FeatureAssembler(SiteErrorPolicy policy) : policy(policy) {}

FeatureAssembler FeatureAssembler::standard(const descriptors::ElementalPropertyTable& table,
                                            std::shared_ptr<const descriptors::TessellationProvider> tessellation,
                                            const AssemblerOptions& options) {
    globalLogger.debug("Initializing standard feature assembler...");
    FeatureAssembler assembler(options.policy);
    assembler.registerBlock(descriptors::PrecomputedFingerprint::agni());
    assembler.registerBlock(descriptors::PrecomputedFingerprint::crystalNN());
    assembler.registerBlock(std::make_unique<descriptors::ShellFingerprint>(table, options.bondTolerance));
    assembler.registerBlock(descriptors::PrecomputedFingerprint::opSite());
    assembler.registerBlock(std::make_unique<descriptors::VoronoiFingerprint>(
        std::move(tessellation), options.tessellationCutoff, options.voronoi));
    globalLogger.debug("Feature assembler ready with " + std::to_string(assembler.featureCount()) + " columns");
    return assembler;
}

void FeatureAssembler::registerBlock(std::unique_ptr<SiteFingerprint> block) {
    if (!block) {
        throw DescriptorException("Cannot register an empty feature block", ErrorCode::INVALID_ARGUMENT);
    }
    if (getBlock(block->getName())) {
        throw DescriptorException("Feature block '" + block->getName() + "' is already registered",
                                  ErrorCode::INVALID_ARGUMENT);
    }
    blocks.push_back(std::move(block));
}

std::vector<std::string> FeatureAssembler::getBlockNames() const {
    std::vector<std::string> names;
    names.reserve(blocks.size());
    for (const auto& block : blocks) {
        names.push_back(block->getName());
    }
    return names;
}

const SiteFingerprint* FeatureAssembler::getBlock(const std::string& name) const {
    for (const auto& block : blocks) {
        if (block->getName() == name) return block.get();
    }
    return nullptr;
}

std::vector<std::string> FeatureAssembler::featureLabels() const {
    std::vector<std::string> labels;
    for (const auto& block : blocks) {
        std::vector<std::string> blockLabels = block->featureLabels();
        labels.insert(labels.end(), blockLabels.begin(), blockLabels.end());
    }
    return labels;
}

std::size_t FeatureAssembler::featureCount() const {
    std::size_t count = 0;
    for (const auto& block : blocks) {
        count += block->featureCount();
    }
    return count;
}

FeatureMatrix FeatureAssembler::assemble(const Structure& structure) const {
    const auto numSites = static_cast<Eigen::Index>(structure.size());
    globalLogger.info("Featurizing structure '" + structure.getName() + "' (" +
                      std::to_string(numSites) + " sites)");

    FeatureMatrix result;
    result.labels = featureLabels();
    Eigen::MatrixXd full(numSites, static_cast<Eigen::Index>(result.labels.size()));

    // First failure per site, in block order
    std::map<std::size_t, SiteFailure> failures;
    Eigen::Index column = 0;
    for (const auto& block : blocks) {
        BlockResult blockResult = block->featurize(structure);
        const auto width = static_cast<Eigen::Index>(block->featureCount());
        if (blockResult.values.rows() != numSites || blockResult.values.cols() != width) {
            throw DescriptorException("Structure '" + structure.getName() + "': block '" + block->getName() +
                                      "' produced " + std::to_string(blockResult.values.rows()) + "x" +
                                      std::to_string(blockResult.values.cols()) + " values, expected " +
                                      std::to_string(numSites) + "x" + std::to_string(width),
                                      ErrorCode::CALCULATION_ERROR);
        }
        full.middleCols(column, width) = blockResult.values;
        column += width;

        for (auto& failure : blockResult.failures) {
            failures.emplace(failure.site, std::move(failure));
        }
        globalLogger.debug("Block '" + block->getName() + "': " + std::to_string(width) + " columns, " +
                           std::to_string(blockResult.failures.size()) + " failed sites");
    }

    if (!failures.empty() && policy == SiteErrorPolicy::Abort) {
        const SiteFailure& first = failures.begin()->second;
        globalLogger.error(first.message);
        std::rethrow_exception(first.error);
    }

    for (Eigen::Index i = 0; i < numSites; ++i) {
        const auto site = static_cast<std::size_t>(i);
        auto failed = failures.find(site);
        if (failed != failures.end()) {
            globalLogger.warning("Skipping site " + std::to_string(site) + " (" +
                                 errorCodeName(failed->second.code) + "): " + failed->second.message);
            result.skipped.push_back(std::move(failed->second));
            continue;
        }
        result.siteIndices.push_back(site);
    }

    result.values.resize(static_cast<Eigen::Index>(result.siteIndices.size()), full.cols());
    for (std::size_t row = 0; row < result.siteIndices.size(); ++row) {
        result.values.row(static_cast<Eigen::Index>(row)) =
            full.row(static_cast<Eigen::Index>(result.siteIndices[row]));
    }

    if (result.siteIndices.empty() && numSites > 0) {
        globalLogger.warning("Structure '" + structure.getName() + "': every site was skipped");
    }
    return result;
}

} // namespace ffpfact
