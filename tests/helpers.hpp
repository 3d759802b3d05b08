#ifndef FFPFACT_TEST_HELPERS
#define FFPFACT_TEST_HELPERS

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ffpfact/structure.hpp"
#include "ffpfact/descriptors/tessellation.hpp"
#include "ffpfact/descriptors/voronoi.hpp"

using ffpfact::descriptors::FacetRecord;
using ffpfact::descriptors::SiteFacets;

// Finite structure from element symbols and Cartesian positions
ffpfact::Structure make_structure(
    const std::string& name,
    const std::vector<std::string>& symbols,
    const std::vector<std::vector<double>>& positions
);

// Atoms on the x axis, `spacing` apart
ffpfact::Structure linear_chain(const std::vector<std::string>& symbols, double spacing);

FacetRecord facet(int n_verts, double volume = 1.0, double area = 1.0, double face_dist = 1.0, double solid_angle = 1.0);

// Voronoi cell of a bcc site: truncated octahedron
std::vector<FacetRecord> bcc_facets();
// Voronoi cell of a fcc site: rhombic dodecahedron
std::vector<FacetRecord> fcc_facets();
// Voronoi cell of the centre of an icosahedral cluster: dodecahedron
std::vector<FacetRecord> icosahedral_facets();

// Returns the same facets for every site and counts backend calls
class CountingTessellation: public ffpfact::descriptors::TessellationProvider {
public:
    explicit CountingTessellation(std::vector<FacetRecord> facets): facets_(std::move(facets)) {}

    std::shared_ptr<const SiteFacets> neighbors(const ffpfact::Structure& structure, double cutoff) const override;

    // Sites that get an empty facet list
    std::vector<size_t> empty_sites;

    size_t calls() const { return calls_.load(); }

private:
    std::vector<FacetRecord> facets_;
    mutable std::atomic<size_t> calls_{0};
};

// AGNI, CrystalNN and OP-site blocks where every entry of row i is `i + 0.5`
void attach_external_blocks(ffpfact::Structure& structure);

#endif
