#include "ffpfact/structure.hpp"
#include "ffpfact/descriptors/element_properties.hpp"
#include "ffpfact/utils.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <utility>

namespace ffpfact {

namespace {

    constexpr double SYMMETRY_TOLERANCE = 1e-8;

    inline void hashCombine(std::uint64_t& seed, std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }

    DescriptorException parseError(const std::string& structureName, const std::string& message) {
        return DescriptorException("Structure '" + structureName + "': " + message, ErrorCode::PARSE_ERROR);
    }

    double readNumber(const rapidjson::Value& value, const std::string& structureName, const std::string& what) {
        if (!value.IsNumber()) {
            throw parseError(structureName, what + " must be a number");
        }
        return value.GetDouble();
    }

    Eigen::MatrixXd readMatrix(const rapidjson::Value& value, const std::string& structureName,
                               const std::string& what) {
        if (!value.IsArray()) {
            throw parseError(structureName, what + " must be an array of rows");
        }
        const auto rows = static_cast<Eigen::Index>(value.Size());
        if (rows == 0) {
            return Eigen::MatrixXd(0, 0);
        }
        if (!value[0].IsArray()) {
            throw parseError(structureName, what + " must be an array of rows");
        }
        const auto cols = static_cast<Eigen::Index>(value[0].Size());
        Eigen::MatrixXd matrix(rows, cols);
        for (Eigen::Index i = 0; i < rows; ++i) {
            const auto& row = value[static_cast<rapidjson::SizeType>(i)];
            if (!row.IsArray() || static_cast<Eigen::Index>(row.Size()) != cols) {
                throw parseError(structureName, what + " row " + std::to_string(i) +
                                 " does not have " + std::to_string(cols) + " entries");
            }
            for (Eigen::Index j = 0; j < cols; ++j) {
                matrix(i, j) = readNumber(row[static_cast<rapidjson::SizeType>(j)], structureName, what);
            }
        }
        return matrix;
    }

    int readSpecies(const rapidjson::Value& value, const std::string& structureName, std::size_t index) {
        if (value.IsInt()) {
            int atomicNumber = value.GetInt();
            if (atomicNumber < 1 || atomicNumber > descriptors::MAX_ATOMIC_NUMBER) {
                throw UnknownSpeciesError("Structure '" + structureName + "', site " + std::to_string(index) +
                                          ": invalid atomic number " + std::to_string(atomicNumber),
                                          atomicNumber);
            }
            return atomicNumber;
        }
        if (value.IsString()) {
            return descriptors::atomicNumberFromSymbol(value.GetString());
        }
        throw parseError(structureName, "site " + std::to_string(index) +
                         " species must be an element symbol or atomic number");
    }

    template<typename Writer>
    void writeMatrix(Writer& writer, const Eigen::MatrixXd& matrix) {
        writer.StartArray();
        for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
            writer.StartArray();
            for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
                writer.Double(matrix(i, j));
            }
            writer.EndArray();
        }
        writer.EndArray();
    }

} // anonymous namespace

Structure::Structure(std::string name, std::vector<Site> sites, Eigen::MatrixXd distanceMatrix,
                     std::optional<Eigen::Matrix3d> lattice)
    : name(std::move(name)), sites(std::move(sites)), lattice(std::move(lattice)),
      distances(std::move(distanceMatrix)) {
    validate();
}

void Structure::validate() const {
    const auto n = static_cast<Eigen::Index>(sites.size());
    if (distances.rows() != n || distances.cols() != n) {
        throw DescriptorException("Structure '" + name + "': distance matrix is " +
                                  std::to_string(distances.rows()) + "x" + std::to_string(distances.cols()) +
                                  " but the structure has " + std::to_string(n) + " sites",
                                  ErrorCode::INVALID_ARGUMENT);
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        if (distances(i, i) != 0.0) {
            throw DescriptorException("Structure '" + name + "': distance matrix diagonal entry " +
                                      std::to_string(i) + " is not zero", ErrorCode::INVALID_ARGUMENT);
        }
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const double dij = distances(i, j);
            const double dji = distances(j, i);
            if (!std::isfinite(dij) || !std::isfinite(dji) || dij < 0.0 || dji < 0.0) {
                throw DescriptorException("Structure '" + name + "': invalid distance between sites " +
                                          std::to_string(i) + " and " + std::to_string(j),
                                          ErrorCode::INVALID_ARGUMENT);
            }
            if (std::abs(dij - dji) > SYMMETRY_TOLERANCE) {
                throw DescriptorException("Structure '" + name + "': distance matrix is not symmetric at (" +
                                          std::to_string(i) + ", " + std::to_string(j) + ")",
                                          ErrorCode::INVALID_ARGUMENT);
            }
        }
    }
}

Structure Structure::fromPositions(std::string name, std::vector<Site> sites) {
    const auto n = static_cast<Eigen::Index>(sites.size());
    Eigen::MatrixXd dist = Eigen::MatrixXd::Zero(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = i + 1; j < n; ++j) {
            double d = (sites[i].position - sites[j].position).norm();
            dist(i, j) = d;
            dist(j, i) = d;
        }
    }
    return Structure(std::move(name), std::move(sites), std::move(dist));
}

Structure Structure::fromJSON(const std::string& json, const std::string& fallbackName) {
    rapidjson::Document document;
    document.Parse(json.c_str());
    if (document.HasParseError()) {
        throw DescriptorException("Invalid structure JSON (offset " + std::to_string(document.GetErrorOffset()) +
                                  "): " + rapidjson::GetParseError_En(document.GetParseError()),
                                  ErrorCode::PARSE_ERROR);
    }
    if (!document.IsObject()) {
        throw DescriptorException("Structure JSON must be an object", ErrorCode::PARSE_ERROR);
    }

    std::string structureName = fallbackName;
    if (document.HasMember("name") && document["name"].IsString()) {
        structureName = document["name"].GetString();
    }

    std::optional<Eigen::Matrix3d> lattice;
    if (document.HasMember("lattice") && !document["lattice"].IsNull()) {
        Eigen::MatrixXd raw = readMatrix(document["lattice"], structureName, "lattice");
        if (raw.rows() != 3 || raw.cols() != 3) {
            throw parseError(structureName, "lattice must be a 3x3 matrix");
        }
        lattice = Eigen::Matrix3d(raw);
    }

    if (!document.HasMember("sites") || !document["sites"].IsArray()) {
        throw parseError(structureName, "missing 'sites' array");
    }
    const auto& jsonSites = document["sites"];
    std::vector<Site> sites;
    sites.reserve(jsonSites.Size());
    for (rapidjson::SizeType i = 0; i < jsonSites.Size(); ++i) {
        const auto& entry = jsonSites[i];
        if (!entry.IsObject() || !entry.HasMember("species") || !entry.HasMember("xyz")) {
            throw parseError(structureName, "site " + std::to_string(i) + " needs 'species' and 'xyz'");
        }
        Site site;
        site.atomicNumber = readSpecies(entry["species"], structureName, i);
        const auto& xyz = entry["xyz"];
        if (!xyz.IsArray() || xyz.Size() != 3) {
            throw parseError(structureName, "site " + std::to_string(i) + " 'xyz' must have three coordinates");
        }
        for (rapidjson::SizeType k = 0; k < 3; ++k) {
            site.position[k] = readNumber(xyz[k], structureName, "site coordinate");
        }
        if (entry.HasMember("properties") && entry["properties"].IsObject()) {
            for (auto it = entry["properties"].MemberBegin(); it != entry["properties"].MemberEnd(); ++it) {
                site.properties[it->name.GetString()] = readNumber(it->value, structureName, "site property");
            }
        }
        sites.push_back(std::move(site));
    }

    const bool hasDistances = document.HasMember("distance_matrix") && !document["distance_matrix"].IsNull();
    if (!hasDistances && lattice) {
        throw parseError(structureName, "periodic structures must provide 'distance_matrix'");
    }

    Structure structure = hasDistances
        ? Structure(structureName, std::move(sites),
                    readMatrix(document["distance_matrix"], structureName, "distance_matrix"), lattice)
        : fromPositions(structureName, std::move(sites));

    if (document.HasMember("site_features") && document["site_features"].IsObject()) {
        const auto& blocks = document["site_features"];
        for (auto it = blocks.MemberBegin(); it != blocks.MemberEnd(); ++it) {
            std::string block = it->name.GetString();
            structure.setSiteFeatures(block, readMatrix(it->value, structureName, "site_features." + block));
        }
    }

    return structure;
}

Structure Structure::fromFile(const std::string& path) {
    std::string stem = std::filesystem::path(path).stem().string();
    return fromJSON(util::readFile(path), stem);
}

std::string Structure::toJSON() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetFormatOptions(rapidjson::kFormatSingleLineArray);

    writer.StartObject();
    writer.Key("name"); writer.String(name.c_str());
    if (lattice) {
        writer.Key("lattice");
        writeMatrix(writer, Eigen::MatrixXd(*lattice));
    }
    writer.Key("sites");
    writer.StartArray();
    for (const auto& s : sites) {
        writer.StartObject();
        writer.Key("species"); writer.String(descriptors::elementSymbol(s.atomicNumber).c_str());
        writer.Key("xyz");
        writer.StartArray();
        for (int k = 0; k < 3; ++k) writer.Double(s.position[k]);
        writer.EndArray();
        if (!s.properties.empty()) {
            writer.Key("properties");
            writer.StartObject();
            for (const auto& prop : s.properties) {
                writer.Key(prop.first.c_str()); writer.Double(prop.second);
            }
            writer.EndObject();
        }
        writer.EndObject();
    }
    writer.EndArray();
    writer.Key("distance_matrix");
    writeMatrix(writer, distances);
    if (!siteFeatures.empty()) {
        writer.Key("site_features");
        writer.StartObject();
        for (const auto& block : siteFeatures) {
            writer.Key(block.first.c_str());
            writeMatrix(writer, block.second);
        }
        writer.EndObject();
    }
    writer.EndObject();
    return buffer.GetString();
}

void Structure::writeJSON(const std::string& path) const {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw DescriptorException("Failed to open output file: " + path, ErrorCode::IO_ERROR);
    }
    file << toJSON() << "\n";
    if (!file.good()) {
        throw DescriptorException("Failed to write structure to " + path, ErrorCode::IO_ERROR);
    }
    globalLogger.info("Wrote structure '" + name + "' to " + path);
}

const Site& Structure::site(std::size_t index) const {
    if (index >= sites.size()) {
        throw DescriptorException("Structure '" + name + "': site index " + std::to_string(index) +
                                  " out of range", ErrorCode::INVALID_ARGUMENT);
    }
    return sites[index];
}

std::vector<int> Structure::getAtomicNumbers() const {
    std::vector<int> atomicNumbers;
    atomicNumbers.reserve(sites.size());
    for (const auto& s : sites) {
        atomicNumbers.push_back(s.atomicNumber);
    }
    return atomicNumbers;
}

std::uint64_t Structure::identityHash() const {
    std::uint64_t seed = 0;
    std::hash<int> intHasher;
    std::hash<double> doubleHasher;
    hashCombine(seed, sites.size());
    for (const auto& s : sites) {
        hashCombine(seed, intHasher(s.atomicNumber));
        for (int k = 0; k < 3; ++k) {
            hashCombine(seed, doubleHasher(s.position[k]));
        }
    }
    if (lattice) {
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                hashCombine(seed, doubleHasher((*lattice)(i, j)));
            }
        }
    }
    return seed;
}

bool Structure::sameGeometry(const Structure& other) const {
    if (sites.size() != other.sites.size() || lattice.has_value() != other.lattice.has_value()) {
        return false;
    }
    if (lattice && *lattice != *other.lattice) {
        return false;
    }
    for (std::size_t i = 0; i < sites.size(); ++i) {
        if (sites[i].atomicNumber != other.sites[i].atomicNumber ||
            sites[i].position != other.sites[i].position) {
            return false;
        }
    }
    return true;
}

void Structure::setSiteProperty(const std::string& property, const Eigen::VectorXd& values) {
    if (static_cast<std::size_t>(values.size()) != sites.size()) {
        throw DescriptorException("Structure '" + name + "': property '" + property + "' has " +
                                  std::to_string(values.size()) + " values for " +
                                  std::to_string(sites.size()) + " sites", ErrorCode::INVALID_ARGUMENT);
    }
    for (std::size_t i = 0; i < sites.size(); ++i) {
        sites[i].properties[property] = values[static_cast<Eigen::Index>(i)];
    }
}

void Structure::setSiteFeatures(const std::string& block, Eigen::MatrixXd values) {
    if (static_cast<std::size_t>(values.rows()) != sites.size()) {
        throw DescriptorException("Structure '" + name + "': feature block '" + block + "' has " +
                                  std::to_string(values.rows()) + " rows for " +
                                  std::to_string(sites.size()) + " sites", ErrorCode::PARSE_ERROR);
    }
    siteFeatures[block] = std::move(values);
}

bool Structure::hasSiteFeatures(const std::string& block) const {
    return siteFeatures.count(block) > 0;
}

const Eigen::MatrixXd& Structure::getSiteFeatures(const std::string& block) const {
    auto it = siteFeatures.find(block);
    if (it == siteFeatures.end()) {
        throw DescriptorException("Structure '" + name + "': missing feature block '" + block + "'",
                                  ErrorCode::PARSE_ERROR);
    }
    return it->second;
}

} // namespace ffpfact
