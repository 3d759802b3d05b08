#pragma once

#include "ffpfact/structure.hpp"
#include "ffpfact/descriptors/voronoi.hpp"

#include <Eigen/Dense>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ffpfact {
namespace descriptors {

// Facets of the Voronoi polyhedron of every site, in structure order
using SiteFacets = std::vector<std::vector<FacetRecord>>;

// Source of per-site Voronoi facets. Implementations must be deterministic
// for a given (structure, cutoff) and safe to call from several threads.
class TessellationProvider {
public:
    virtual ~TessellationProvider() = default;
    virtual std::shared_ptr<const SiteFacets> neighbors(const Structure& structure, double cutoff) const = 0;
};

// Facets produced ahead of time by an external tessellation engine and stored as
// {"name": ..., "cutoff": c, "sites": [[{"n_verts", "volume", "area", "face_dist", "solid_angle"}, ...], ...]}
class PrecomputedTessellation : public TessellationProvider {
private:
    std::string name;
    double cutoff;
    std::shared_ptr<const SiteFacets> facets;

public:
    PrecomputedTessellation(std::string name, double cutoff, SiteFacets facets);

    static PrecomputedTessellation fromJSON(const std::string& json);
    static PrecomputedTessellation fromFile(const std::string& path);

    const std::string& getName() const { return name; }
    double getCutoff() const { return cutoff; }
    std::size_t size() const { return facets->size(); }

    // Throws DescriptorException(INVALID_ARGUMENT) when the site count or the cutoff differ
    std::shared_ptr<const SiteFacets> neighbors(const Structure& structure, double cutoff) const override;
};

// Memoizes another provider per (structure, cutoff). Concurrent requests for the
// same key wait for a single backend call; failures are not cached.
class CachingTessellation : public TessellationProvider {
private:
    static constexpr std::size_t DEFAULT_MAX_ENTRIES = 64;

    using Key = std::pair<std::uint64_t, double>;

    // Species, positions and lattice of a cached structure; guards against identity hash collisions
    struct Geometry {
        std::vector<int> atomicNumbers;
        Eigen::Matrix3Xd positions;
        std::optional<Eigen::Matrix3d> lattice;

        explicit Geometry(const Structure& structure);
        bool matches(const Structure& structure) const;
    };

    struct CacheEntry {
        Geometry geometry;
        std::shared_future<std::shared_ptr<const SiteFacets>> result;
        std::chrono::steady_clock::time_point lastAccess;
    };

    std::shared_ptr<const TessellationProvider> backend;
    std::size_t maxEntries;
    mutable std::mutex cacheMutex;
    mutable std::map<Key, CacheEntry> cache;

    // Drops the least recently used entries until keepEntries remain; caller holds the lock
    void cleanupCache(std::size_t keepEntries) const;

public:
    explicit CachingTessellation(std::shared_ptr<const TessellationProvider> backend,
                                 std::size_t maxEntries = DEFAULT_MAX_ENTRIES);

    std::shared_ptr<const SiteFacets> neighbors(const Structure& structure, double cutoff) const override;

    std::size_t size() const;
    void clear();
};

} // namespace descriptors
} // namespace ffpfact
