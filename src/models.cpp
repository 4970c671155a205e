#include "models.hpp"
#include "utils.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <map>

namespace pfpred {

namespace {

const char kMagic[] = "RFBIN";
const uint16_t kVersion = 2;

template <typename T>
void readValue(std::ifstream& file, T& value, const std::string& filename, const char* what) {
    file.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!file) {
        throw PredictionException("Truncated model file " + filename + " while reading " + what,
                                  ErrorCode::MODEL_LOAD_FAILURE);
    }
}

// Bytes between the read position and end of file
uint64_t bytesLeft(std::ifstream& file) {
    const auto pos = file.tellg();
    file.seekg(0, std::ios::end);
    const auto end = file.tellg();
    file.seekg(pos);
    return end > pos ? static_cast<uint64_t>(end - pos) : 0;
}

void requireBytes(std::ifstream& file, uint64_t needed, const std::string& filename, const char* what) {
    if (needed > bytesLeft(file)) {
        throw PredictionException("Model file " + filename + " is too short for its " + what,
                                  ErrorCode::MODEL_LOAD_FAILURE);
    }
}

// feature, threshold, left, right, value
const uint64_t kNodeBytes = 4 * 5;

template <typename T>
void writeValue(std::ofstream& file, const T& value) {
    file.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

} // namespace

const char* modelKindName(ModelKind kind) {
    return kind == ModelKind::CLASSIFIER ? "classifier" : "regressor";
}

RandomForestModel loadRandomForestModel(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw PredictionException("Cannot open model file: " + filename, ErrorCode::MODEL_LOAD_FAILURE);
    }

    RandomForestModel model;
    char magic[6] = {0};
    file.read(magic, 5);
    if (!file || std::string(magic) != kMagic) {
        throw PredictionException("Invalid model file format: " + filename, ErrorCode::MODEL_LOAD_FAILURE);
    }

    uint16_t version;
    readValue(file, version, filename, "version");
    if (version != kVersion) {
        throw PredictionException("Unsupported model version " + std::to_string(version) + " in " + filename,
                                  ErrorCode::MODEL_LOAD_FAILURE);
    }

    uint8_t kind;
    readValue(file, kind, filename, "model kind");
    if (kind > static_cast<uint8_t>(ModelKind::REGRESSOR)) {
        throw PredictionException("Unknown model kind in " + filename, ErrorCode::MODEL_LOAD_FAILURE);
    }
    model.kind = static_cast<ModelKind>(kind);

    readValue(file, model.n_estimators, filename, "estimator count");
    readValue(file, model.n_features, filename, "feature count");
    if (model.n_estimators <= 0 || model.n_features <= 0) {
        throw PredictionException("Model " + filename + " has no estimators or no features",
                                  ErrorCode::MODEL_LOAD_FAILURE);
    }

    uint32_t nameCount;
    readValue(file, nameCount, filename, "feature name count");
    if (nameCount != 0 && nameCount != static_cast<uint32_t>(model.n_features)) {
        throw PredictionException("Model " + filename + " lists " + std::to_string(nameCount) +
                                  " feature names for " + std::to_string(model.n_features) + " features",
                                  ErrorCode::MODEL_LOAD_FAILURE);
    }
    for (uint32_t i = 0; i < nameCount; i++) {
        uint32_t nameLen;
        readValue(file, nameLen, filename, "feature name");
        requireBytes(file, nameLen, filename, "feature names");
        std::string name(nameLen, ' ');
        file.read(&name[0], nameLen);
        if (!file) {
            throw PredictionException("Truncated model file " + filename + " while reading feature name",
                                      ErrorCode::MODEL_LOAD_FAILURE);
        }
        model.featureNames.push_back(name);
    }

    requireBytes(file, static_cast<uint64_t>(model.n_estimators) * sizeof(uint32_t), filename, "estimator count");
    model.trees.resize(model.n_estimators);
    for (int tree_idx = 0; tree_idx < model.n_estimators; tree_idx++) {
        uint32_t node_count;
        readValue(file, node_count, filename, "node count");
        if (node_count == 0) {
            throw PredictionException("Empty tree in model " + filename, ErrorCode::MODEL_LOAD_FAILURE);
        }
        requireBytes(file, static_cast<uint64_t>(node_count) * kNodeBytes, filename, "node count");
        auto& tree = model.trees[tree_idx];
        tree.resize(node_count);
        for (uint32_t node_idx = 0; node_idx < node_count; node_idx++) {
            TreeNode& node = tree[node_idx];
            readValue(file, node.feature, filename, "node");
            readValue(file, node.threshold, filename, "node");
            readValue(file, node.left_child, filename, "node");
            readValue(file, node.right_child, filename, "node");
            readValue(file, node.value, filename, "node");

            if (node.left_child == -1) continue;
            // Children always follow their parent, so traversal terminates
            bool childrenValid = node.left_child > static_cast<int>(node_idx) &&
                                 node.right_child > static_cast<int>(node_idx) &&
                                 node.left_child < static_cast<int>(node_count) &&
                                 node.right_child < static_cast<int>(node_count);
            if (!childrenValid || node.feature < 0 || node.feature >= model.n_features) {
                throw PredictionException("Corrupt node " + std::to_string(node_idx) + " in tree " +
                                          std::to_string(tree_idx) + " of " + filename,
                                          ErrorCode::MODEL_LOAD_FAILURE);
            }
        }
    }
    return model;
}

void saveRandomForestModel(const RandomForestModel& model, const std::string& filename) {
    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw PredictionException("Cannot open model file for writing: " + filename, ErrorCode::IO_ERROR);
    }

    file.write(kMagic, 5);
    writeValue(file, kVersion);
    writeValue(file, static_cast<uint8_t>(model.kind));
    writeValue(file, model.n_estimators);
    writeValue(file, model.n_features);
    writeValue(file, static_cast<uint32_t>(model.featureNames.size()));
    for (const auto& name : model.featureNames) {
        writeValue(file, static_cast<uint32_t>(name.size()));
        file.write(name.data(), static_cast<std::streamsize>(name.size()));
    }
    for (const auto& tree : model.trees) {
        writeValue(file, static_cast<uint32_t>(tree.size()));
        for (const auto& node : tree) {
            writeValue(file, node.feature);
            writeValue(file, node.threshold);
            writeValue(file, node.left_child);
            writeValue(file, node.right_child);
            writeValue(file, node.value);
        }
    }
    if (!file) {
        throw PredictionException("Failed to write model file: " + filename, ErrorCode::IO_ERROR);
    }
}

float RandomForestModel::leafValue(const std::vector<TreeNode>& tree, const std::vector<float>& features) const {
    int node_id = 0;
    while (true) {
        const TreeNode& node = tree[node_id];
        if (node.left_child == -1) {
            return node.value;
        }
        if (features[node.feature] <= node.threshold) {
            node_id = node.left_child;
        } else {
            node_id = node.right_child;
        }
    }
}

double RandomForestModel::predictValue(const std::vector<float>& features) const {
    double sum = 0.0;
    for (const auto& tree : trees) {
        sum += leafValue(tree, features);
    }
    return (n_estimators > 0) ? (sum / n_estimators) : 0.0;
}

int RandomForestModel::predictClass(const std::vector<float>& features) const {
    std::map<int, int> votes;
    for (const auto& tree : trees) {
        votes[static_cast<int>(std::lround(leafValue(tree, features)))]++;
    }
    int best = 0;
    int bestVotes = -1;
    for (const auto& [label, count] : votes) {
        if (count > bestVotes) {
            best = label;
            bestVotes = count;
        }
    }
    return best;
}

ActivityLabel activityLabelFromCode(int code) {
    return code == 1 ? ActivityLabel::ACTIVE : ActivityLabel::INACTIVE;
}

const char* activityLabelName(ActivityLabel label) {
    return label == ActivityLabel::ACTIVE ? "Active" : "Inactive";
}

std::string formatPotency(double value) {
    return util::formatFixed(value, 2);
}

// --- ModelCache ---
std::shared_ptr<const RandomForestModel> ModelService::ModelCache::getModel(const std::string& modelPath,
                                                                            ModelKind kind) {
    std::error_code ec;
    auto modified = std::filesystem::last_write_time(modelPath, ec);
    if (ec) {
        throw PredictionException("Cannot open model file: " + modelPath + " (" + ec.message() + ")",
                                  ErrorCode::MODEL_LOAD_FAILURE);
    }

    std::lock_guard<std::mutex> lock(mutex);
    auto it = models.find(modelPath);
    if (it == models.end() || it->second.modified != modified) {
        auto model = std::make_shared<const RandomForestModel>(loadRandomForestModel(modelPath));
        globalLogger.info("Loaded " + std::string(modelKindName(model->kind)) + " model: " + modelPath +
                          " (" + std::to_string(model->n_estimators) + " trees, " +
                          std::to_string(model->n_features) + " features)");
        it = models.insert_or_assign(modelPath, Entry{modified, model}).first;
    }

    if (it->second.model->kind != kind) {
        throw PredictionException("Model " + modelPath + " is a " + modelKindName(it->second.model->kind) +
                                  ", expected a " + modelKindName(kind),
                                  ErrorCode::MODEL_LOAD_FAILURE);
    }
    return it->second.model;
}

void ModelService::ModelCache::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    models.clear();
}

size_t ModelService::ModelCache::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return models.size();
}

// --- ModelService ---
ModelService::ModelService(const std::string& classifierPath, const std::string& regressorPath)
    : classifierPath(classifierPath), regressorPath(regressorPath) {}

std::shared_ptr<const RandomForestModel> ModelService::loadClassifier() {
    return cache.getModel(classifierPath, ModelKind::CLASSIFIER);
}

std::shared_ptr<const RandomForestModel> ModelService::loadRegressor() {
    return cache.getModel(regressorPath, ModelKind::REGRESSOR);
}

void ModelService::validateShape(const RandomForestModel& model, const std::vector<std::string>& columns) {
    if (columns.size() != static_cast<size_t>(model.n_features)) {
        throw PredictionException("Model expects " + std::to_string(model.n_features) +
                                  " features, input has " + std::to_string(columns.size()),
                                  ErrorCode::FEATURE_SHAPE_MISMATCH);
    }
    if (model.featureNames.empty()) {
        return;
    }
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] != model.featureNames[i]) {
            throw PredictionException("Feature " + std::to_string(i) + " is '" + columns[i] +
                                      "', model expects '" + model.featureNames[i] + "'",
                                      ErrorCode::FEATURE_SHAPE_MISMATCH);
        }
    }
}

static std::vector<float> toFloatRow(const std::vector<double>& row) {
    return std::vector<float>(row.begin(), row.end());
}

ActivityPrediction ModelService::classify(const DescriptorVector& descriptors) {
    auto model = loadClassifier();
    validateShape(*model, descriptors.names);

    ActivityPrediction prediction;
    prediction.code = model->predictClass(toFloatRow(descriptors.values));
    prediction.label = activityLabelFromCode(prediction.code);
    if (prediction.code != 0 && prediction.code != 1) {
        globalLogger.warning("Classifier returned unexpected code " + std::to_string(prediction.code) +
                             ", reporting Inactive");
    }
    return prediction;
}

PotencyPrediction ModelService::regress(const FeatureMatrix& features) {
    auto model = loadRegressor();
    validateShape(*model, features.columnNames);
    if (features.rows() == 0) {
        throw PredictionException("Feature matrix has no rows", ErrorCode::FEATURE_SHAPE_MISMATCH);
    }

    PotencyPrediction prediction;
    prediction.value = model->predictValue(toFloatRow(features.row(0)));
    prediction.display = formatPotency(prediction.value);
    return prediction;
}

} // namespace pfpred
