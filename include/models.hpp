#pragma once

#include "descriptors.hpp"
#include "features.hpp"
#include "utils.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pfpred {

enum class ModelKind : uint8_t {
    CLASSIFIER = 0,
    REGRESSOR = 1
};

const char* modelKindName(ModelKind kind);

struct TreeNode {
    int feature;
    float threshold;
    int left_child;   // -1 marks a leaf
    int right_child;
    float value;      // class label or regression value at leaves
};

struct RandomForestModel {
    ModelKind kind = ModelKind::REGRESSOR;
    int n_estimators = 0;
    int n_features = 0;
    std::vector<std::string> featureNames; // optional, training column order
    std::vector<std::vector<TreeNode>> trees;

    // Mean of leaf values
    double predictValue(const std::vector<float>& features) const;
    // Majority vote over leaf labels, ties go to the smaller label
    int predictClass(const std::vector<float>& features) const;

private:
    float leafValue(const std::vector<TreeNode>& tree, const std::vector<float>& features) const;
};

// RFBIN v2: magic, version, kind, estimator and feature counts, feature
// names, then the flattened trees. Throws MODEL_LOAD_FAILURE.
RandomForestModel loadRandomForestModel(const std::string& filename);
void saveRandomForestModel(const RandomForestModel& model, const std::string& filename);

enum class ActivityLabel {
    ACTIVE,
    INACTIVE
};

// Code 1 is Active. Every other code, including ones the classifier was
// never trained on, reads as Inactive.
ActivityLabel activityLabelFromCode(int code);
const char* activityLabelName(ActivityLabel label);

struct ActivityPrediction {
    int code = 0;
    ActivityLabel label = ActivityLabel::INACTIVE;
};

struct PotencyPrediction {
    double value = 0.0;   // as predicted
    std::string display;  // two decimals
};

std::string formatPotency(double value);

class ModelService {
protected:
    class ModelCache {
    public:
        std::shared_ptr<const RandomForestModel> getModel(const std::string& modelPath, ModelKind kind);
        void clear();
        size_t size() const;
    private:
        struct Entry {
            std::filesystem::file_time_type modified;
            std::shared_ptr<const RandomForestModel> model;
        };
        mutable std::mutex mutex;
        std::unordered_map<std::string, Entry> models;
    };

    std::string classifierPath;
    std::string regressorPath;
    ModelCache cache;

public:
    ModelService(const std::string& classifierPath, const std::string& regressorPath);
    virtual ~ModelService() = default;

    virtual ActivityPrediction classify(const DescriptorVector& descriptors);
    virtual PotencyPrediction regress(const FeatureMatrix& features);

    std::shared_ptr<const RandomForestModel> loadClassifier();
    std::shared_ptr<const RandomForestModel> loadRegressor();

    // Throws FEATURE_SHAPE_MISMATCH when the column count, or the recorded
    // feature names, disagree with the model.
    static void validateShape(const RandomForestModel& model, const std::vector<std::string>& columns);

    void clearCache() { cache.clear(); }
    size_t cachedModels() const { return cache.size(); }
};

} // namespace pfpred
