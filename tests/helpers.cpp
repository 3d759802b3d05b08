#include "helpers.hpp"

#include "ffpfact/descriptors/element_properties.hpp"

using namespace ffpfact;

Structure make_structure(
    const std::string& name,
    const std::vector<std::string>& symbols,
    const std::vector<std::vector<double>>& positions
) {
    std::vector<Site> sites;
    for (size_t i = 0; i < symbols.size(); i++) {
        Site site;
        site.atomicNumber = descriptors::atomicNumberFromSymbol(symbols[i]);
        site.position = Eigen::Vector3d(positions[i][0], positions[i][1], positions[i][2]);
        sites.push_back(site);
    }
    return Structure::fromPositions(name, sites);
}

Structure linear_chain(const std::vector<std::string>& symbols, double spacing) {
    std::vector<std::vector<double>> positions;
    for (size_t i = 0; i < symbols.size(); i++) {
        positions.push_back({spacing * static_cast<double>(i), 0.0, 0.0});
    }
    return make_structure("chain", symbols, positions);
}

FacetRecord facet(int n_verts, double volume, double area, double face_dist, double solid_angle) {
    FacetRecord record;
    record.nVerts = n_verts;
    record.volume = volume;
    record.area = area;
    record.faceDist = face_dist;
    record.solidAngle = solid_angle;
    return record;
}

std::vector<FacetRecord> bcc_facets() {
    auto facets = std::vector<FacetRecord>();
    for (int i = 0; i < 6; i++) {
        facets.push_back(facet(4, 0.5, 1.0, 1.435, 0.6));
    }
    for (int i = 0; i < 8; i++) {
        facets.push_back(facet(6, 1.5, 2.6, 1.243, 1.1));
    }
    return facets;
}

std::vector<FacetRecord> fcc_facets() {
    return std::vector<FacetRecord>(12, facet(4, 1.0, 2.0, 1.25, 1.047));
}

std::vector<FacetRecord> icosahedral_facets() {
    return std::vector<FacetRecord>(12, facet(5, 0.9, 1.8, 1.3, 1.047));
}

std::shared_ptr<const SiteFacets> CountingTessellation::neighbors(const Structure& structure, double) const {
    calls_++;
    auto result = std::make_shared<SiteFacets>(structure.size(), facets_);
    for (auto site: empty_sites) {
        (*result)[site].clear();
    }
    return result;
}

void attach_external_blocks(Structure& structure) {
    const auto n = static_cast<Eigen::Index>(structure.size());
    auto block = [n](Eigen::Index width) {
        Eigen::MatrixXd values(n, width);
        for (Eigen::Index i = 0; i < n; i++) {
            values.row(i).setConstant(static_cast<double>(i) + 0.5);
        }
        return values;
    };
    structure.setSiteFeatures("agni", block(8));
    structure.setSiteFeatures("crystal_nn", block(24));
    structure.setSiteFeatures("op_site", block(37));
}
