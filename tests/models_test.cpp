// Tests for the RFBIN random forest reader and ModelService

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "models.hpp"
#include "test_support.hpp"

namespace {

using pfpred::ActivityLabel;
using pfpred::DescriptorVector;
using pfpred::ErrorCode;
using pfpred::FeatureMatrix;
using pfpred::ModelKind;
using pfpred::ModelService;
using pfpred::PredictionException;
using pfpred::RandomForestModel;
using pfpred::TreeNode;

// Single split on one feature: value <= threshold goes left.
std::vector<TreeNode> stump(int feature, float threshold, float left, float right) {
  return {
    {feature, threshold, 1, 2, 0.0f},
    {-1, 0.0f, -1, -1, left},
    {-1, 0.0f, -1, -1, right},
  };
}

std::vector<TreeNode> leaf(float value) {
  return {{-1, 0.0f, -1, -1, value}};
}

RandomForestModel lipinskiClassifier() {
  RandomForestModel model;
  model.kind = ModelKind::CLASSIFIER;
  model.n_features = 4;
  model.featureNames = {"MW", "LogP", "NumHDonors", "NumHAcceptors"};
  // Two trees vote on MW, one on LogP
  model.trees = {stump(0, 500.0f, 1.0f, 0.0f), stump(0, 500.0f, 1.0f, 0.0f), stump(1, 5.0f, 1.0f, 0.0f)};
  model.n_estimators = static_cast<int>(model.trees.size());
  return model;
}

RandomForestModel constantClassifier(std::vector<float> votes) {
  RandomForestModel model;
  model.kind = ModelKind::CLASSIFIER;
  model.n_features = 4;
  for (float v : votes) {
    model.trees.push_back(leaf(v));
  }
  model.n_estimators = static_cast<int>(model.trees.size());
  return model;
}

RandomForestModel constantRegressor(std::vector<float> leaves, int nFeatures) {
  RandomForestModel model;
  model.kind = ModelKind::REGRESSOR;
  model.n_features = nFeatures;
  for (float v : leaves) {
    model.trees.push_back(leaf(v));
  }
  model.n_estimators = static_cast<int>(model.trees.size());
  return model;
}

DescriptorVector descriptors(double mw, double logp, double hbd, double hba) {
  DescriptorVector v;
  v.names = {"MW", "LogP", "NumHDonors", "NumHAcceptors"};
  v.values = {mw, logp, hbd, hba};
  return v;
}

FeatureMatrix features(const std::vector<std::string>& names, const std::vector<double>& values) {
  FeatureMatrix m;
  m.columnNames = names;
  m.rowNames = {"Compound_name"};
  m.values.resize(1, static_cast<Eigen::Index>(values.size()));
  for (size_t i = 0; i < values.size(); ++i) {
    m.values(0, static_cast<Eigen::Index>(i)) = values[i];
  }
  return m;
}

template <typename T>
void append(std::string& bytes, T value) {
  bytes.append(reinterpret_cast<const char*>(&value), sizeof(T));
}

// RFBIN header for a regressor without feature names
std::string header(int32_t nEstimators, int32_t nFeatures) {
  std::string bytes = "RFBIN";
  append<uint16_t>(bytes, 2);
  append<uint8_t>(bytes, 1);
  append<int32_t>(bytes, nEstimators);
  append<int32_t>(bytes, nFeatures);
  append<uint32_t>(bytes, 0);
  return bytes;
}

ErrorCode codeOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const PredictionException& e) {
    return e.getCode();
  }
  return ErrorCode::SUCCESS;
}

TEST(TestActivityLabel, Mapping) {
  EXPECT_EQ(pfpred::activityLabelFromCode(1), ActivityLabel::ACTIVE);
  EXPECT_EQ(pfpred::activityLabelFromCode(0), ActivityLabel::INACTIVE);
  EXPECT_EQ(pfpred::activityLabelFromCode(7), ActivityLabel::INACTIVE);
  EXPECT_EQ(pfpred::activityLabelFromCode(-1), ActivityLabel::INACTIVE);
  EXPECT_STREQ(pfpred::activityLabelName(ActivityLabel::ACTIVE), "Active");
  EXPECT_STREQ(pfpred::activityLabelName(ActivityLabel::INACTIVE), "Inactive");
}

TEST(TestFormatPotency, TwoDecimals) {
  EXPECT_EQ(pfpred::formatPotency(6.12345), "6.12");
  EXPECT_EQ(pfpred::formatPotency(7.0), "7.00");
  EXPECT_EQ(pfpred::formatPotency(4.5678), "4.57");
}

TEST(TestRandomForestModel, MajorityVote) {
  RandomForestModel model = lipinskiClassifier();
  EXPECT_EQ(model.predictClass({300.0f, 2.0f, 1.0f, 1.0f}), 1);
  EXPECT_EQ(model.predictClass({600.0f, 2.0f, 1.0f, 1.0f}), 0);
  EXPECT_EQ(model.predictClass({300.0f, 7.0f, 1.0f, 1.0f}), 1);
}

TEST(TestRandomForestModel, TieGoesToSmallerLabel) {
  RandomForestModel model = constantClassifier({1.0f, 0.0f});
  EXPECT_EQ(model.predictClass({0, 0, 0, 0}), 0);
}

TEST(TestRandomForestModel, MeanOfLeaves) {
  RandomForestModel model = constantRegressor({6.0f, 6.5f}, 1);
  EXPECT_DOUBLE_EQ(model.predictValue({0.0f}), 6.25);
}

class TestModelFiles : public pfpred::testing_support::ScratchDirTest {};

TEST_F(TestModelFiles, SaveThenLoadKeepsStructure) {
  RandomForestModel original = lipinskiClassifier();
  pfpred::saveRandomForestModel(original, path("clf.rfbin"));
  RandomForestModel loaded = pfpred::loadRandomForestModel(path("clf.rfbin"));

  EXPECT_EQ(loaded.kind, ModelKind::CLASSIFIER);
  EXPECT_EQ(loaded.n_estimators, 3);
  EXPECT_EQ(loaded.n_features, 4);
  EXPECT_EQ(loaded.featureNames, original.featureNames);
  EXPECT_EQ(loaded.predictClass({600.0f, 2.0f, 0.0f, 0.0f}), 0);
}

TEST_F(TestModelFiles, MissingFile) {
  EXPECT_EQ(codeOf([&]() { pfpred::loadRandomForestModel(path("nope.rfbin")); }),
            ErrorCode::MODEL_LOAD_FAILURE);
}

TEST_F(TestModelFiles, WrongMagic) {
  writeFile("bad.rfbin", "PICKLE-DATA-NOT-A-FOREST");
  EXPECT_EQ(codeOf([&]() { pfpred::loadRandomForestModel(path("bad.rfbin")); }),
            ErrorCode::MODEL_LOAD_FAILURE);
}

TEST_F(TestModelFiles, Truncated) {
  pfpred::saveRandomForestModel(lipinskiClassifier(), path("full.rfbin"));
  const std::string bytes = readFile(path("full.rfbin"));
  writeFile("cut.rfbin", bytes.substr(0, bytes.size() - 7));
  EXPECT_EQ(codeOf([&]() { pfpred::loadRandomForestModel(path("cut.rfbin")); }),
            ErrorCode::MODEL_LOAD_FAILURE);
}

TEST_F(TestModelFiles, ChildPointingBackwardsIsRejected) {
  RandomForestModel model = constantRegressor({1.0f}, 1);
  model.trees[0] = {{0, 0.5f, 0, 0, 0.0f}};
  pfpred::saveRandomForestModel(model, path("loop.rfbin"));
  EXPECT_EQ(codeOf([&]() { pfpred::loadRandomForestModel(path("loop.rfbin")); }),
            ErrorCode::MODEL_LOAD_FAILURE);
}

TEST_F(TestModelFiles, HugeEstimatorCount) {
  writeFile("many.rfbin", header(0x7fffffff, 3));
  EXPECT_EQ(codeOf([&]() { pfpred::loadRandomForestModel(path("many.rfbin")); }),
            ErrorCode::MODEL_LOAD_FAILURE);
}

TEST_F(TestModelFiles, HugeNodeCount) {
  std::string bytes = header(1, 3);
  append<uint32_t>(bytes, 0xffffffffu);
  writeFile("nodes.rfbin", bytes);
  EXPECT_EQ(codeOf([&]() { pfpred::loadRandomForestModel(path("nodes.rfbin")); }),
            ErrorCode::MODEL_LOAD_FAILURE);
}

TEST_F(TestModelFiles, HugeFeatureNameLength) {
  std::string bytes = "RFBIN";
  append<uint16_t>(bytes, 2);
  append<uint8_t>(bytes, 1);
  append<int32_t>(bytes, 1);
  append<int32_t>(bytes, 1);
  append<uint32_t>(bytes, 1);
  append<uint32_t>(bytes, 0xfffffff0u);
  writeFile("name.rfbin", bytes);
  EXPECT_EQ(codeOf([&]() { pfpred::loadRandomForestModel(path("name.rfbin")); }),
            ErrorCode::MODEL_LOAD_FAILURE);
}

class TestModelService : public pfpred::testing_support::ScratchDirTest {
  protected:
    void SetUp() override {
      ScratchDirTest::SetUp();
      pfpred::saveRandomForestModel(lipinskiClassifier(), path("lipinski_model.rfbin"));
      pfpred::saveRandomForestModel(constantRegressor({6.12345f}, 3), path("pic50_model.rfbin"));
    }
};

TEST_F(TestModelService, ClassifyActive) {
  ModelService models(path("lipinski_model.rfbin"), path("pic50_model.rfbin"));
  auto prediction = models.classify(descriptors(46.07, -0.0014, 1, 1));
  EXPECT_EQ(prediction.code, 1);
  EXPECT_EQ(prediction.label, ActivityLabel::ACTIVE);
}

TEST_F(TestModelService, ClassifyInactive) {
  ModelService models(path("lipinski_model.rfbin"), path("pic50_model.rfbin"));
  auto prediction = models.classify(descriptors(812.0, 6.2, 6, 12));
  EXPECT_EQ(prediction.code, 0);
  EXPECT_EQ(prediction.label, ActivityLabel::INACTIVE);
}

TEST_F(TestModelService, UnexpectedClassCodeIsInactive) {
  pfpred::saveRandomForestModel(constantClassifier({7.0f}), path("odd.rfbin"));
  ModelService models(path("odd.rfbin"), path("pic50_model.rfbin"));
  auto prediction = models.classify(descriptors(46.07, -0.0014, 1, 1));
  EXPECT_EQ(prediction.code, 7);
  EXPECT_EQ(prediction.label, ActivityLabel::INACTIVE);
}

TEST_F(TestModelService, RegressRoundsAfterPrediction) {
  ModelService models(path("lipinski_model.rfbin"), path("pic50_model.rfbin"));
  auto prediction = models.regress(features({"FP0", "FP1", "FP2"}, {1, 0, 1}));
  EXPECT_NEAR(prediction.value, 6.12345, 1e-5);
  EXPECT_EQ(prediction.display, "6.12");
}

TEST_F(TestModelService, WrongColumnCount) {
  ModelService models(path("lipinski_model.rfbin"), path("pic50_model.rfbin"));
  EXPECT_EQ(codeOf([&]() { models.regress(features({"FP0", "FP1"}, {1, 0})); }),
            ErrorCode::FEATURE_SHAPE_MISMATCH);
}

TEST_F(TestModelService, WrongColumnOrder) {
  ModelService models(path("lipinski_model.rfbin"), path("pic50_model.rfbin"));
  DescriptorVector swapped = descriptors(46.07, -0.0014, 1, 1);
  std::swap(swapped.names[0], swapped.names[1]);
  EXPECT_EQ(codeOf([&]() { models.classify(swapped); }), ErrorCode::FEATURE_SHAPE_MISMATCH);
}

TEST_F(TestModelService, MissingArtifact) {
  ModelService models(path("absent.rfbin"), path("absent.rfbin"));
  EXPECT_EQ(codeOf([&]() { models.classify(descriptors(46.07, -0.0014, 1, 1)); }),
            ErrorCode::MODEL_LOAD_FAILURE);
}

TEST_F(TestModelService, WrongKindIsLoadFailure) {
  // Regressor file configured as the classifier
  ModelService models(path("pic50_model.rfbin"), path("lipinski_model.rfbin"));
  EXPECT_EQ(codeOf([&]() { models.classify(descriptors(46.07, -0.0014, 1, 1)); }),
            ErrorCode::MODEL_LOAD_FAILURE);
}

TEST_F(TestModelService, LoadsOnceAndReloadsWhenFileChanges) {
  ModelService models(path("lipinski_model.rfbin"), path("pic50_model.rfbin"));
  auto first = models.loadRegressor();
  auto again = models.loadRegressor();
  EXPECT_EQ(first.get(), again.get());
  EXPECT_EQ(models.cachedModels(), 1u);

  pfpred::saveRandomForestModel(constantRegressor({5.0f}, 3), path("pic50_model.rfbin"));
  // Make sure the modification time moves even on coarse-grained filesystems
  std::filesystem::last_write_time(path("pic50_model.rfbin"),
                                   std::filesystem::last_write_time(path("pic50_model.rfbin")) +
                                       std::chrono::seconds(2));
  auto reloaded = models.loadRegressor();
  EXPECT_NE(reloaded.get(), first.get());
  EXPECT_EQ(models.regress(features({"FP0", "FP1", "FP2"}, {0, 0, 0})).display, "5.00");
}

}  // namespace
