#include "ffpfact/descriptors/tessellation.hpp"
#include "ffpfact/utils.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace ffpfact {
namespace descriptors {

namespace {

    constexpr double CUTOFF_TOLERANCE = 1e-9;

    DescriptorException facetError(const std::string& message) {
        return DescriptorException("Tessellation: " + message, ErrorCode::PARSE_ERROR);
    }

    double readField(const rapidjson::Value& facet, const char* field, const std::string& where) {
        auto it = facet.FindMember(field);
        if (it == facet.MemberEnd() || !it->value.IsNumber()) {
            throw facetError(where + " is missing numeric field '" + field + "'");
        }
        return it->value.GetDouble();
    }

    FacetRecord readFacet(const rapidjson::Value& value, const std::string& where) {
        if (!value.IsObject()) {
            throw facetError(where + " must be an object");
        }
        auto verts = value.FindMember("n_verts");
        if (verts == value.MemberEnd() || !verts->value.IsInt()) {
            throw facetError(where + " is missing integer field 'n_verts'");
        }
        FacetRecord facet;
        facet.nVerts = verts->value.GetInt();
        facet.volume = readField(value, "volume", where);
        facet.area = readField(value, "area", where);
        facet.faceDist = readField(value, "face_dist", where);
        facet.solidAngle = readField(value, "solid_angle", where);
        return facet;
    }

} // anonymous namespace

PrecomputedTessellation::PrecomputedTessellation(std::string name, double cutoff, SiteFacets facets)
    : name(std::move(name)), cutoff(cutoff),
      facets(std::make_shared<const SiteFacets>(std::move(facets))) {
    if (!(cutoff > 0.0) || !std::isfinite(cutoff)) {
        throw DescriptorException("Tessellation cutoff must be positive, got " + std::to_string(cutoff),
                                  ErrorCode::INVALID_ARGUMENT);
    }
}

PrecomputedTessellation PrecomputedTessellation::fromJSON(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError()) {
        throw facetError(std::string("JSON parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
                         ": " + rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        throw facetError("document must be an object");
    }

    std::string name;
    auto nameIt = doc.FindMember("name");
    if (nameIt != doc.MemberEnd() && nameIt->value.IsString()) {
        name = nameIt->value.GetString();
    }

    auto cutoffIt = doc.FindMember("cutoff");
    double cutoff = DEFAULT_TESSELLATION_CUTOFF;
    if (cutoffIt != doc.MemberEnd()) {
        if (!cutoffIt->value.IsNumber()) {
            throw facetError("'cutoff' must be a number");
        }
        cutoff = cutoffIt->value.GetDouble();
    }

    auto sitesIt = doc.FindMember("sites");
    if (sitesIt == doc.MemberEnd() || !sitesIt->value.IsArray()) {
        throw facetError("'sites' must be an array of facet lists");
    }

    SiteFacets facets;
    facets.reserve(sitesIt->value.Size());
    for (rapidjson::SizeType i = 0; i < sitesIt->value.Size(); ++i) {
        const auto& siteFacets = sitesIt->value[i];
        if (!siteFacets.IsArray()) {
            throw facetError("site " + std::to_string(i) + " must be an array of facets");
        }
        std::vector<FacetRecord> records;
        records.reserve(siteFacets.Size());
        for (rapidjson::SizeType k = 0; k < siteFacets.Size(); ++k) {
            records.push_back(readFacet(siteFacets[k],
                                        "site " + std::to_string(i) + " facet " + std::to_string(k)));
        }
        facets.push_back(std::move(records));
    }
    return PrecomputedTessellation(std::move(name), cutoff, std::move(facets));
}

PrecomputedTessellation PrecomputedTessellation::fromFile(const std::string& path) {
    return fromJSON(util::readFile(path));
}

std::shared_ptr<const SiteFacets> PrecomputedTessellation::neighbors(const Structure& structure,
                                                                     double requestedCutoff) const {
    if (facets->size() != structure.size()) {
        throw DescriptorException("Structure '" + structure.getName() + "' has " +
                                  std::to_string(structure.size()) + " sites but the tessellation has " +
                                  std::to_string(facets->size()), ErrorCode::INVALID_ARGUMENT);
    }
    if (std::abs(requestedCutoff - cutoff) > CUTOFF_TOLERANCE) {
        throw DescriptorException("Structure '" + structure.getName() + "': tessellation was computed with cutoff " +
                                  std::to_string(cutoff) + ", requested " + std::to_string(requestedCutoff),
                                  ErrorCode::INVALID_ARGUMENT);
    }
    if (!name.empty() && name != structure.getName()) {
        globalLogger.warning("Tessellation '" + name + "' used for structure '" + structure.getName() + "'");
    }
    return facets;
}

CachingTessellation::CachingTessellation(std::shared_ptr<const TessellationProvider> backend,
                                         std::size_t maxEntries)
    : backend(std::move(backend)), maxEntries(maxEntries) {
    if (!this->backend) {
        throw DescriptorException("Caching tessellation needs a backend provider", ErrorCode::INVALID_ARGUMENT);
    }
    if (maxEntries == 0) {
        throw DescriptorException("Caching tessellation needs room for at least one entry",
                                  ErrorCode::INVALID_ARGUMENT);
    }
}

void CachingTessellation::cleanupCache(std::size_t keepEntries) const {
    if (cache.size() <= keepEntries) return;

    std::vector<std::pair<Key, std::chrono::steady_clock::time_point>> entries;
    entries.reserve(cache.size());
    for (const auto& pair : cache) {
        entries.emplace_back(pair.first, pair.second.lastAccess);
    }

    // Oldest first
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.second < b.second; });

    std::size_t removeCount = cache.size() - keepEntries;
    for (std::size_t i = 0; i < removeCount; ++i) {
        cache.erase(entries[i].first);
    }
}

CachingTessellation::Geometry::Geometry(const Structure& structure)
    : atomicNumbers(structure.getAtomicNumbers()),
      positions(3, static_cast<Eigen::Index>(structure.size())),
      lattice(structure.getLattice()) {
    for (std::size_t i = 0; i < structure.size(); ++i) {
        positions.col(static_cast<Eigen::Index>(i)) = structure.getSites()[i].position;
    }
}

bool CachingTessellation::Geometry::matches(const Structure& structure) const {
    if (atomicNumbers.size() != structure.size() || lattice.has_value() != structure.isPeriodic()) {
        return false;
    }
    if (lattice && *lattice != *structure.getLattice()) {
        return false;
    }
    for (std::size_t i = 0; i < atomicNumbers.size(); ++i) {
        const Site& site = structure.getSites()[i];
        if (atomicNumbers[i] != site.atomicNumber ||
            positions.col(static_cast<Eigen::Index>(i)) != site.position) {
            return false;
        }
    }
    return true;
}

std::shared_ptr<const SiteFacets> CachingTessellation::neighbors(const Structure& structure, double cutoff) const {
    const Key key(structure.identityHash(), cutoff);
    std::shared_future<std::shared_ptr<const SiteFacets>> result;
    std::promise<std::shared_ptr<const SiteFacets>> promise;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(cacheMutex);
        auto it = cache.find(key);
        if (it != cache.end() && it->second.geometry.matches(structure)) {
            it->second.lastAccess = std::chrono::steady_clock::now();
            result = it->second.result;
        } else {
            if (it != cache.end()) {
                cache.erase(it);
            }
            result = promise.get_future().share();
            cache.emplace(key, CacheEntry{Geometry(structure), result, std::chrono::steady_clock::now()});
            owner = true;
            cleanupCache(maxEntries);
        }
    }

    if (owner) {
        globalLogger.debug("Tessellating structure '" + structure.getName() + "' with cutoff " +
                           std::to_string(cutoff));
        try {
            promise.set_value(backend->neighbors(structure, cutoff));
        } catch (const std::exception&) {
            promise.set_exception(std::current_exception());
            std::lock_guard<std::mutex> lock(cacheMutex);
            auto it = cache.find(key);
            if (it != cache.end() && it->second.geometry.matches(structure)) {
                cache.erase(it);
            }
            throw;
        }
    }
    return result.get();
}

std::size_t CachingTessellation::size() const {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return cache.size();
}

void CachingTessellation::clear() {
    std::lock_guard<std::mutex> lock(cacheMutex);
    cache.clear();
}

} // namespace descriptors
} // namespace ffpfact
