#include "ffpfact/prediction.hpp"
#include "ffpfact/utils.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <utility>

namespace ffpfact {
namespace prediction {

namespace {

    struct PrecursorInfo {
        PrecursorType type;
        const char* name;
        PostProcess post;
    };

    const std::vector<PrecursorInfo>& precursorTable() {
        static const std::vector<PrecursorInfo> table = {
            {PrecursorType::PartialCharge, "partial_charge", PostProcess::MeanCenter},
            {PrecursorType::FluctuatingPolarizability, "fluctuating_polarizability", PostProcess::Exp10},
            {PrecursorType::FFPolarizability, "FF_polarizability", PostProcess::Exp10},
            {PrecursorType::C6Coefficient, "C6_coefficient", PostProcess::Exp10},
            {PrecursorType::QDOMass, "QDO_mass", PostProcess::Identity},
            {PrecursorType::QDOCharge, "QDO_charge", PostProcess::Identity},
            {PrecursorType::QDOFrequency, "QDO_frequency", PostProcess::Identity},
            {PrecursorType::AElectronParameter, "a_electron_parameter", PostProcess::Identity},
            {PrecursorType::BElectronParameter, "b_electron_parameter", PostProcess::Identity}
        };
        return table;
    }

    const PrecursorInfo& info(PrecursorType type) {
        for (const auto& entry : precursorTable()) {
            if (entry.type == type) return entry;
        }
        throw DescriptorException("Unhandled precursor type", ErrorCode::INVALID_ARGUMENT);
    }

    rapidjson::Document parseDocument(const std::string& json, const std::string& source) {
        rapidjson::Document doc;
        doc.Parse(json.c_str());
        if (doc.HasParseError()) {
            throw DescriptorException(source + ": JSON parse error at offset " + std::to_string(doc.GetErrorOffset()) +
                                      ": " + rapidjson::GetParseError_En(doc.GetParseError()),
                                      ErrorCode::PARSE_ERROR);
        }
        if (!doc.IsObject()) {
            throw DescriptorException(source + ": document must be an object", ErrorCode::PARSE_ERROR);
        }
        return doc;
    }

    Eigen::VectorXd readVector(const rapidjson::Value& doc, const char* field, const std::string& source) {
        auto it = doc.FindMember(field);
        if (it == doc.MemberEnd() || !it->value.IsArray()) {
            throw DescriptorException(source + ": '" + field + "' must be an array of numbers", ErrorCode::PARSE_ERROR);
        }
        Eigen::VectorXd values(static_cast<Eigen::Index>(it->value.Size()));
        for (rapidjson::SizeType i = 0; i < it->value.Size(); ++i) {
            if (!it->value[i].IsNumber()) {
                throw DescriptorException(source + ": '" + field + "' entry " + std::to_string(i) +
                                          " is not a number", ErrorCode::PARSE_ERROR);
            }
            values[static_cast<Eigen::Index>(i)] = it->value[i].GetDouble();
        }
        return values;
    }

    void checkColumns(std::size_t expected, const Eigen::MatrixXd& features, const std::string& what) {
        if (static_cast<std::size_t>(features.cols()) != expected) {
            throw DescriptorException(what + " expects " + std::to_string(expected) + " features, got " +
                                      std::to_string(features.cols()), ErrorCode::INVALID_ARGUMENT);
        }
    }

} // anonymous namespace

const std::vector<PrecursorType>& allPrecursorTypes() {
    static const std::vector<PrecursorType> types = [] {
        std::vector<PrecursorType> result;
        for (const auto& entry : precursorTable()) {
            result.push_back(entry.type);
        }
        return result;
    }();
    return types;
}

std::string precursorName(PrecursorType type) {
    return info(type).name;
}

PostProcess postProcessing(PrecursorType type) {
    return info(type).post;
}

PrecursorType parsePrecursorType(const std::string& name) {
    for (const auto& entry : precursorTable()) {
        if (name == entry.name) return entry.type;
    }
    throw UnsupportedPrecursorError(name);
}

std::vector<PrecursorType> parsePrecursorRequest(const std::vector<std::string>& names) {
    if (names.empty() || (names.size() == 1 && names[0] == "all")) {
        return allPrecursorTypes();
    }
    std::vector<PrecursorType> types;
    for (const auto& name : names) {
        PrecursorType type = parsePrecursorType(name);
        if (std::find(types.begin(), types.end(), type) == types.end()) {
            types.push_back(type);
        }
    }
    return types;
}

Eigen::VectorXd postProcess(PrecursorType type, const Eigen::VectorXd& raw) {
    switch (postProcessing(type)) {
        case PostProcess::MeanCenter:
            if (raw.size() == 0) return raw;
            return (raw.array() - raw.mean()).matrix();
        case PostProcess::Exp10:
            return raw.unaryExpr([](double x) { return std::pow(10.0, x); });
        case PostProcess::Identity:
            return raw;
    }
    return raw;
}

// --- StandardScaler ---

StandardScaler::StandardScaler(Eigen::RowVectorXd mean, Eigen::RowVectorXd scale)
    : mean(std::move(mean)), scale(std::move(scale)) {
    if (this->mean.size() != this->scale.size()) {
        throw DescriptorException("Scaler mean and scale lengths differ", ErrorCode::PARSE_ERROR);
    }
    if ((this->scale.array() == 0.0).any() || !this->scale.allFinite() || !this->mean.allFinite()) {
        throw DescriptorException("Scaler scale must be finite and non-zero", ErrorCode::PARSE_ERROR);
    }
}

std::shared_ptr<StandardScaler> StandardScaler::fromJSON(const std::string& json, const std::string& source) {
    rapidjson::Document doc = parseDocument(json, source);
    Eigen::RowVectorXd mean = readVector(doc, "mean", source).transpose();
    Eigen::RowVectorXd scale = readVector(doc, "scale", source).transpose();
    return std::make_shared<StandardScaler>(std::move(mean), std::move(scale));
}

Eigen::MatrixXd StandardScaler::transform(const Eigen::MatrixXd& features) const {
    checkColumns(featureCount(), features, "Scaler");
    return ((features.rowwise() - mean).array().rowwise() / scale.array()).matrix();
}

// --- LinearRegressor ---

LinearRegressor::LinearRegressor(Eigen::VectorXd coef, double intercept)
    : coef(std::move(coef)), intercept(intercept) {
    if (!this->coef.allFinite() || !std::isfinite(intercept)) {
        throw DescriptorException("Linear model coefficients must be finite", ErrorCode::PARSE_ERROR);
    }
}

std::shared_ptr<LinearRegressor> LinearRegressor::fromJSON(const std::string& json, const std::string& source) {
    rapidjson::Document doc = parseDocument(json, source);
    Eigen::VectorXd coef = readVector(doc, "coef", source);
    auto it = doc.FindMember("intercept");
    if (it == doc.MemberEnd() || !it->value.IsNumber()) {
        throw DescriptorException(source + ": 'intercept' must be a number", ErrorCode::PARSE_ERROR);
    }
    return std::make_shared<LinearRegressor>(std::move(coef), it->value.GetDouble());
}

Eigen::VectorXd LinearRegressor::predict(const Eigen::MatrixXd& features) const {
    checkColumns(featureCount(), features, "Linear model");
    return ((features * coef).array() + intercept).matrix();
}

// --- JsonModelStore ---

JsonModelStore::JsonModelStore(std::string root) : root(std::move(root)) {
    if (!std::filesystem::is_directory(this->root)) {
        throw DescriptorException("Model directory not found: " + this->root, ErrorCode::IO_ERROR);
    }
}

std::string JsonModelStore::scalerPath(PrecursorType type) const {
    return (std::filesystem::path(root) / precursorName(type) / "scaler.json").string();
}

std::string JsonModelStore::modelPath(PrecursorType type, std::size_t index) const {
    return (std::filesystem::path(root) / precursorName(type) /
            ("best_model_" + std::to_string(index) + ".json")).string();
}

std::shared_ptr<const FeatureScaler> JsonModelStore::scaler(PrecursorType type) const {
    const std::string path = scalerPath(type);
    globalLogger.debug("Loading scaler " + path);
    return StandardScaler::fromJSON(util::readFile(path), path);
}

std::vector<std::shared_ptr<const Regressor>> JsonModelStore::ensemble(PrecursorType type) const {
    std::vector<std::shared_ptr<const Regressor>> models;
    for (std::size_t k = 0; k < PredictionPipeline::ENSEMBLE_SIZE; ++k) {
        const std::string path = modelPath(type, k);
        globalLogger.debug("Loading model " + path);
        models.push_back(LinearRegressor::fromJSON(util::readFile(path), path));
    }
    return models;
}

// --- PredictionPipeline ---

PredictionPipeline::PredictionPipeline(std::shared_ptr<const ModelStore> store) : store(std::move(store)) {
    if (!this->store) {
        throw DescriptorException("Prediction pipeline needs a model store", ErrorCode::INVALID_ARGUMENT);
    }
}

Eigen::VectorXd PredictionPipeline::predict(PrecursorType type, const Eigen::MatrixXd& features) const {
    const std::string name = precursorName(type);
    auto scaler = store->scaler(type);
    auto models = store->ensemble(type);
    if (!scaler) {
        throw DescriptorException("No scaler for " + name, ErrorCode::IO_ERROR);
    }
    if (models.size() != ENSEMBLE_SIZE) {
        throw DescriptorException(name + ": expected " + std::to_string(ENSEMBLE_SIZE) + " models, got " +
                                  std::to_string(models.size()), ErrorCode::INVALID_ARGUMENT);
    }

    const Eigen::MatrixXd scaled = scaler->transform(features);
    Eigen::VectorXd sum = Eigen::VectorXd::Zero(features.rows());
    for (const auto& model : models) {
        if (!model) {
            throw DescriptorException(name + ": missing ensemble member", ErrorCode::IO_ERROR);
        }
        sum += model->predict(scaled);
    }
    const Eigen::VectorXd mean = sum / static_cast<double>(ENSEMBLE_SIZE);
    return postProcess(type, mean);
}

void PredictionPipeline::annotate(Structure& structure, const FeatureMatrix& features,
                                  const std::vector<PrecursorType>& types) const {
    if (features.rows() != structure.size()) {
        throw DescriptorException("Structure '" + structure.getName() + "': " +
                                  std::to_string(structure.size() - features.rows()) +
                                  " sites have no features, cannot predict site properties",
                                  ErrorCode::INVALID_ARGUMENT);
    }
    // Properties are attached only once every requested type has been predicted
    std::vector<std::pair<std::string, Eigen::VectorXd>> predictions;
    predictions.reserve(types.size());
    for (PrecursorType type : types) {
        const std::string name = precursorName(type);
        globalLogger.info("Predicting " + name + " for structure '" + structure.getName() + "'");
        predictions.emplace_back(name, predict(type, features.values));
    }
    for (const auto& entry : predictions) {
        structure.setSiteProperty(entry.first, entry.second);
    }
}

void PredictionPipeline::annotate(Structure& structure, const FeatureMatrix& features,
                                  const std::vector<std::string>& typeNames) const {
    annotate(structure, features, parsePrecursorRequest(typeNames));
}

} // namespace prediction
} // namespace ffpfact
