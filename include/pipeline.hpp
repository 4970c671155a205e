#pragma once

#include "descriptors.hpp"
#include "features.hpp"
#include "models.hpp"
#include "proteins.hpp"
#include "utils.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace pfpred {

enum class Task {
    LIPINSKI,
    ACTIVITY,
    POTENCY,
    PROTEINS
};

const std::vector<Task>& allTasks();
// "Compute Lipinski's Descriptors", ...
const char* taskDisplayName(Task task);
// Short command line name: lipinski, activity, potency, proteins
const char* taskKey(Task task);
// Accepts the short name (any case) or the display name.
// Throws std::invalid_argument otherwise.
Task parseTask(const std::string& name);

enum class PipelineState {
    AWAITING_INPUT,
    VALIDATING,
    COMPUTING_DESCRIPTORS,
    RUNNING_CLASSIFIER,
    RUNNING_REGRESSOR,
    RETRIEVING_PROTEINS,
    FORMATTING,
    DONE,
    FAILED
};

const char* pipelineStateName(PipelineState state);

// One user-facing sentence per failure kind
std::string userMessage(ErrorCode code);

struct PipelineRequest {
    std::string smiles;
    Task task = Task::LIPINSKI;
    const std::atomic<bool>* cancelled = nullptr;
};

struct PipelineResult {
    Task task = Task::LIPINSKI;
    std::string smiles;
    PipelineState state = PipelineState::AWAITING_INPUT;
    std::vector<PipelineState> trace;

    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;  // user-visible
    std::string detail;   // exception text, also logged

    // Payload, filled only on success
    DescriptorVector descriptors;
    std::optional<ActivityPrediction> activity;
    std::optional<PotencyPrediction> potency;
    std::vector<std::string> proteins;

    std::string output;
    std::string molecule;  // Molecule::toJSON of the validated input

    bool ok() const { return state == PipelineState::DONE; }
    std::string toJSON() const;
};

// Runs one task for one SMILES string. Every failure ends in the FAILED state
// with an empty payload; nothing escapes run().
class Orchestrator {
private:
    LipinskiEngine& lipinski;
    FeatureGenerator& featureGenerator;
    ModelService& models;
    ProteinRetriever& proteins;

    void enter(PipelineResult& result, PipelineState state) const;
    void fail(PipelineResult& result, ErrorCode code, const std::string& detail) const;
    void execute(const PipelineRequest& request, PipelineResult& result);

public:
    Orchestrator(LipinskiEngine& lipinski, FeatureGenerator& featureGenerator,
                 ModelService& models, ProteinRetriever& proteins);

    PipelineResult run(const PipelineRequest& request);

    static std::string formatLipinski(const DescriptorVector& descriptors);
    static std::string formatPotency(const PotencyPrediction& potency);
    static std::string formatProteins(const std::vector<std::string>& identifiers);
};

struct BatchSummary {
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
};

// Reads the first token of every non-blank line. Throws IO_ERROR.
std::vector<std::string> readSmilesList(const std::string& path);

// Runs task on every input and writes SMILES,Status,Result rows in input
// order. Uses TBB when available.
BatchSummary runBatch(Orchestrator& orchestrator, Task task, const std::vector<std::string>& smiles,
                      const std::string& outputPath, const std::atomic<bool>* cancelled = nullptr);

} // namespace pfpred
