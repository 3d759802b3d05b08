#pragma once

#include "ffpfact/descriptors.hpp"
#include "ffpfact/structure.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace ffpfact {
namespace prediction {

enum class PrecursorType {
    PartialCharge,
    FluctuatingPolarizability,
    FFPolarizability,
    C6Coefficient,
    QDOMass,
    QDOCharge,
    QDOFrequency,
    AElectronParameter,
    BElectronParameter
};

enum class PostProcess {
    Identity,
    MeanCenter, // subtract the structure mean so the values sum to zero
    Exp10       // models are fitted on log10 of the target
};

const std::vector<PrecursorType>& allPrecursorTypes();
std::string precursorName(PrecursorType type);
PostProcess postProcessing(PrecursorType type);

// Throws UnsupportedPrecursorError for anything outside the nine known identifiers
PrecursorType parsePrecursorType(const std::string& name);
// Empty list or "all" selects every type; duplicates are dropped, order kept
std::vector<PrecursorType> parsePrecursorRequest(const std::vector<std::string>& names);

Eigen::VectorXd postProcess(PrecursorType type, const Eigen::VectorXd& raw);

// --- Model artifacts ---

class FeatureScaler {
public:
    virtual ~FeatureScaler() = default;
    virtual std::size_t featureCount() const = 0;
    virtual Eigen::MatrixXd transform(const Eigen::MatrixXd& features) const = 0;
};

// (x - mean) / scale per column
class StandardScaler : public FeatureScaler {
private:
    Eigen::RowVectorXd mean;
    Eigen::RowVectorXd scale;

public:
    StandardScaler(Eigen::RowVectorXd mean, Eigen::RowVectorXd scale);

    // {"mean": [...], "scale": [...]}
    static std::shared_ptr<StandardScaler> fromJSON(const std::string& json, const std::string& source = "scaler");

    std::size_t featureCount() const override { return static_cast<std::size_t>(mean.size()); }
    Eigen::MatrixXd transform(const Eigen::MatrixXd& features) const override;
};

class Regressor {
public:
    virtual ~Regressor() = default;
    virtual std::size_t featureCount() const = 0;
    virtual Eigen::VectorXd predict(const Eigen::MatrixXd& features) const = 0;
};

class LinearRegressor : public Regressor {
private:
    Eigen::VectorXd coef;
    double intercept;

public:
    LinearRegressor(Eigen::VectorXd coef, double intercept);

    // {"coef": [...], "intercept": x}
    static std::shared_ptr<LinearRegressor> fromJSON(const std::string& json, const std::string& source = "model");

    std::size_t featureCount() const override { return static_cast<std::size_t>(coef.size()); }
    Eigen::VectorXd predict(const Eigen::MatrixXd& features) const override;
};

// Source of the pretrained scaler and model ensemble of each precursor type
class ModelStore {
public:
    virtual ~ModelStore() = default;
    virtual std::shared_ptr<const FeatureScaler> scaler(PrecursorType type) const = 0;
    virtual std::vector<std::shared_ptr<const Regressor>> ensemble(PrecursorType type) const = 0;
};

// <root>/<type>/scaler.json and <root>/<type>/best_model_<k>.json, k = 0..4
class JsonModelStore : public ModelStore {
private:
    std::string root;

public:
    explicit JsonModelStore(std::string root);

    const std::string& getRoot() const { return root; }
    std::string scalerPath(PrecursorType type) const;
    std::string modelPath(PrecursorType type, std::size_t index) const;

    std::shared_ptr<const FeatureScaler> scaler(PrecursorType type) const override;
    std::vector<std::shared_ptr<const Regressor>> ensemble(PrecursorType type) const override;
};

class PredictionPipeline {
private:
    std::shared_ptr<const ModelStore> store;

public:
    static constexpr std::size_t ENSEMBLE_SIZE = 5;

    explicit PredictionPipeline(std::shared_ptr<const ModelStore> store);

    // Scaled features, mean of the ensemble, then post-processing
    Eigen::VectorXd predict(PrecursorType type, const Eigen::MatrixXd& features) const;

    // Attaches one site property per requested type. Every site must have a feature row.
    // When any prediction fails the structure is left unchanged.
    void annotate(Structure& structure, const FeatureMatrix& features,
                  const std::vector<PrecursorType>& types) const;
    // Validates every identifier before any model is touched
    void annotate(Structure& structure, const FeatureMatrix& features,
                  const std::vector<std::string>& typeNames) const;
};

} // namespace prediction
} // namespace ffpfact
