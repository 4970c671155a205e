#include "pipeline.hpp"
#include "io.hpp"
#include "utils.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#ifdef PFPRED_WITH_TBB
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#endif

namespace pfpred {

const std::vector<Task>& allTasks() {
    static const std::vector<Task> tasks = {Task::LIPINSKI, Task::ACTIVITY, Task::POTENCY, Task::PROTEINS};
    return tasks;
}

const char* taskDisplayName(Task task) {
    switch (task) {
        case Task::LIPINSKI: return "Compute Lipinski's Descriptors";
        case Task::ACTIVITY: return "Predict the Compound's Activity";
        case Task::POTENCY:  return "Predict the Compound's pIC50";
        case Task::PROTEINS: return "Retrieve interacting proteins";
    }
    return "Unknown task";
}

const char* taskKey(Task task) {
    switch (task) {
        case Task::LIPINSKI: return "lipinski";
        case Task::ACTIVITY: return "activity";
        case Task::POTENCY:  return "potency";
        case Task::PROTEINS: return "proteins";
    }
    return "unknown";
}

Task parseTask(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (Task task : allTasks()) {
        if (lower == taskKey(task) || name == taskDisplayName(task)) {
            return task;
        }
    }
    throw std::invalid_argument("Unknown task: " + name);
}

const char* pipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::AWAITING_INPUT:        return "AwaitingInput";
        case PipelineState::VALIDATING:            return "Validating";
        case PipelineState::COMPUTING_DESCRIPTORS: return "ComputingDescriptors";
        case PipelineState::RUNNING_CLASSIFIER:    return "RunningClassifier";
        case PipelineState::RUNNING_REGRESSOR:     return "RunningRegressor";
        case PipelineState::RETRIEVING_PROTEINS:   return "RetrievingProteins";
        case PipelineState::FORMATTING:            return "Formatting";
        case PipelineState::DONE:                  return "Done";
        case PipelineState::FAILED:                return "Failed";
    }
    return "Unknown";
}

std::string userMessage(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:
            return "";
        case ErrorCode::INVALID_STRUCTURE:
            return "Invalid SMILES. Enter a canonical SMILES string.";
        case ErrorCode::EXTERNAL_TOOL_FAILURE:
            return "Descriptor calculation failed. Check the PaDEL-Descriptor installation.";
        case ErrorCode::FEATURE_PARSE_FAILURE:
            return "The calculated descriptors could not be read.";
        case ErrorCode::MODEL_LOAD_FAILURE:
            return "The prediction model could not be loaded.";
        case ErrorCode::FEATURE_SHAPE_MISMATCH:
            return "The descriptors do not match what the prediction model expects.";
        case ErrorCode::SEARCH_FAILURE:
            return "The protein database could not be searched. Try again later.";
        case ErrorCode::CANCELLED:
            return "The request was cancelled.";
        case ErrorCode::IO_ERROR:
            return "A working file could not be read or written.";
        case ErrorCode::UNKNOWN_ERROR:
            break;
    }
    return "An unexpected error occurred.";
}

// --- PipelineResult ---
std::string PipelineResult::toJSON() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("task"); writer.String(taskKey(task));
    writer.Key("smiles"); writer.String(smiles.c_str());
    writer.Key("status"); writer.String(pipelineStateName(state));
    writer.Key("trace");
    writer.StartArray();
    for (PipelineState s : trace) {
        writer.String(pipelineStateName(s));
    }
    writer.EndArray();

    if (!ok()) {
        writer.Key("error"); writer.String(errorCodeName(error));
        writer.Key("message"); writer.String(message.c_str());
        writer.EndObject();
        return buffer.GetString();
    }

    writer.Key("output"); writer.String(output.c_str());
    if (!molecule.empty()) {
        writer.Key("molecule");
        writer.RawValue(molecule.c_str(), molecule.size(), rapidjson::kObjectType);
    }
    switch (task) {
        case Task::LIPINSKI:
            writer.Key("descriptors");
            writer.StartObject();
            for (size_t i = 0; i < descriptors.size(); ++i) {
                writer.Key(descriptors.names[i].c_str());
                writer.Double(descriptors.values[i]);
            }
            writer.EndObject();
            break;
        case Task::ACTIVITY:
            if (activity) {
                writer.Key("label"); writer.String(activityLabelName(activity->label));
                writer.Key("code"); writer.Int(activity->code);
            }
            break;
        case Task::POTENCY:
            if (potency) {
                writer.Key("pIC50"); writer.Double(potency->value);
                writer.Key("display"); writer.String(potency->display.c_str());
            }
            break;
        case Task::PROTEINS:
            writer.Key("proteins");
            writer.StartArray();
            for (const auto& id : proteins) {
                writer.String(id.c_str());
            }
            writer.EndArray();
            break;
    }
    writer.EndObject();
    return buffer.GetString();
}

// --- Orchestrator ---
Orchestrator::Orchestrator(LipinskiEngine& lipinski, FeatureGenerator& featureGenerator,
                           ModelService& models, ProteinRetriever& proteins)
    : lipinski(lipinski), featureGenerator(featureGenerator), models(models), proteins(proteins) {}

void Orchestrator::enter(PipelineResult& result, PipelineState state) const {
    result.state = state;
    result.trace.push_back(state);
    globalLogger.debug(std::string("[") + taskKey(result.task) + "] " + pipelineStateName(state));
}

void Orchestrator::fail(PipelineResult& result, ErrorCode code, const std::string& detail) const {
    result.error = code;
    result.detail = detail;
    result.message = userMessage(code);
    if (code == ErrorCode::INVALID_STRUCTURE && !detail.empty()) {
        result.message += " (" + detail + ")";
    }
    result.descriptors = DescriptorVector();
    result.activity.reset();
    result.potency.reset();
    result.proteins.clear();
    result.output.clear();
    result.molecule.clear();
    enter(result, PipelineState::FAILED);
    globalLogger.error(std::string(taskDisplayName(result.task)) + " failed for '" + result.smiles +
                       "' [" + errorCodeName(code) + "]: " + detail);
}

PipelineResult Orchestrator::run(const PipelineRequest& request) {
    PipelineResult result;
    result.task = request.task;
    result.smiles = request.smiles;
    result.trace.push_back(PipelineState::AWAITING_INPUT);

    try {
        execute(request, result);
    } catch (const PredictionException& e) {
        fail(result, e.getCode(), e.what());
    } catch (const std::exception& e) {
        fail(result, ErrorCode::UNKNOWN_ERROR, e.what());
    }
    return result;
}

void Orchestrator::execute(const PipelineRequest& request, PipelineResult& result) {
    enter(result, PipelineState::VALIDATING);
    Molecule mol = Molecule::validate(request.smiles);

    if (request.cancelled && request.cancelled->load()) {
        throw PredictionException("Cancelled after validation", ErrorCode::CANCELLED);
    }

    DescriptorVector descriptors;
    std::optional<ActivityPrediction> activity;
    std::optional<PotencyPrediction> potency;
    std::vector<std::string> identifiers;

    switch (request.task) {
        case Task::LIPINSKI:
            enter(result, PipelineState::COMPUTING_DESCRIPTORS);
            descriptors = lipinski.calculate(mol);
            break;
        case Task::ACTIVITY:
            enter(result, PipelineState::COMPUTING_DESCRIPTORS);
            descriptors = lipinski.calculate(mol);
            enter(result, PipelineState::RUNNING_CLASSIFIER);
            activity = models.classify(descriptors);
            break;
        case Task::POTENCY: {
            enter(result, PipelineState::RUNNING_REGRESSOR);
            FeatureMatrix features = featureGenerator.generate(mol, request.cancelled);
            potency = models.regress(features);
            break;
        }
        case Task::PROTEINS:
            enter(result, PipelineState::RETRIEVING_PROTEINS);
            identifiers = proteins.retrieve(mol);
            break;
    }

    enter(result, PipelineState::FORMATTING);
    switch (request.task) {
        case Task::LIPINSKI: result.output = formatLipinski(descriptors); break;
        case Task::ACTIVITY: result.output = activityLabelName(activity->label); break;
        case Task::POTENCY:  result.output = formatPotency(*potency); break;
        case Task::PROTEINS: result.output = formatProteins(identifiers); break;
    }

    result.descriptors = std::move(descriptors);
    result.activity = activity;
    result.potency = potency;
    result.proteins = std::move(identifiers);
    result.molecule = mol.toJSON();
    enter(result, PipelineState::DONE);
}

std::string Orchestrator::formatLipinski(const DescriptorVector& descriptors) {
    const auto& labels = LipinskiEngine::displayNames();
    size_t width = 0;
    for (const auto& label : labels) {
        width = std::max(width, label.size());
    }

    std::ostringstream ss;
    for (size_t i = 0; i < descriptors.size() && i < labels.size(); ++i) {
        double value = descriptors.values[i];
        ss << std::left << std::setw(static_cast<int>(width) + 2) << labels[i];
        if (value == std::floor(value) && std::fabs(value) < 1e9) {
            ss << static_cast<long long>(value);
        } else {
            ss << util::formatFixed(value, 4);
        }
        if (i + 1 < descriptors.size()) ss << '\n';
    }
    return ss.str();
}

std::string Orchestrator::formatPotency(const PotencyPrediction& potency) {
    return "The pIC50 of your compound is " + potency.display;
}

std::string Orchestrator::formatProteins(const std::vector<std::string>& identifiers) {
    if (identifiers.empty()) {
        return "No interacting proteins found";
    }
    std::string joined;
    for (size_t i = 0; i < identifiers.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += identifiers[i];
    }
    return joined;
}

// --- Batch ---
std::vector<std::string> readSmilesList(const std::string& path) {
    MoleculeStream stream(path);
    if (!stream.good()) {
        throw PredictionException("Cannot open input file: " + path, ErrorCode::IO_ERROR);
    }
    std::vector<std::string> smiles;
    std::string line;
    while (stream.next(line)) {
        smiles.push_back(line);
    }
    globalLogger.info("Read " + std::to_string(stream.getProcessedCount()) + " SMILES from " + path);
    return smiles;
}

static std::string flattenOutput(const std::string& text) {
    std::string flat = text;
    std::replace(flat.begin(), flat.end(), '\n', ';');
    return flat;
}

BatchSummary runBatch(Orchestrator& orchestrator, Task task, const std::vector<std::string>& smiles,
                      const std::string& outputPath, const std::atomic<bool>* cancelled) {
    std::vector<PipelineResult> results(smiles.size());

    auto runOne = [&](size_t i) {
        PipelineRequest request;
        request.smiles = smiles[i];
        request.task = task;
        request.cancelled = cancelled;
        results[i] = orchestrator.run(request);
    };

#ifdef PFPRED_WITH_TBB
    tbb::parallel_for(tbb::blocked_range<size_t>(0, smiles.size()),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i != range.end(); ++i) {
                runOne(i);
            }
        });
#else
    for (size_t i = 0; i < smiles.size(); ++i) {
        runOne(i);
    }
#endif

    BatchSummary summary;
    summary.total = results.size();
    CsvIO::ResultWriter writer(outputPath, ",", {"SMILES", "Status", "Result"});
    for (const auto& result : results) {
        bool written;
        if (result.ok()) {
            summary.succeeded++;
            written = writer.writeRow({result.smiles, "OK", flattenOutput(result.output)});
        } else {
            summary.failed++;
            written = writer.writeRow({result.smiles, errorCodeName(result.error), result.message});
        }
        if (!written) {
            throw PredictionException("Failed to write results to " + outputPath, ErrorCode::IO_ERROR);
        }
    }
    writer.flush();

    globalLogger.info("Batch finished: " + std::to_string(summary.succeeded) + " succeeded, " +
                      std::to_string(summary.failed) + " failed");
    return summary;
}

} // namespace pfpred
