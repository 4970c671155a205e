#include <cxxopts.hpp>
#include <RDGeneral/RDLog.h>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "descriptors.hpp"
#include "features.hpp"
#include "models.hpp"
#include "pipeline.hpp"
#include "process.hpp"
#include "proteins.hpp"
#include "utils.hpp"

#ifdef PFPRED_WITH_TBB
#include <tbb/global_control.h>
#endif

using namespace pfpred;

void printVersion() {
    std::cout << "\033[1;36mPfPredict\033[0m (\033[1mpfpredict\033[0m) v0.1.0" << std::endl;
}

void printHelp(const cxxopts::Options& options) {
    std::cout << options.help() << std::endl;
}

void printTasks() {
    std::cout << "\033[1;36mAvailable tasks:\033[0m" << std::endl;
    for (Task task : allTasks()) {
        std::cout << "\033[1;32m" << std::left << std::setw(12) << taskKey(task) << "\033[0m"
                  << taskDisplayName(task) << std::endl;
    }
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("\033[1;36mpfpredict\033[0m",
                             "Anti-malarial (Plasmodium falciparum) compound prediction");

    options.add_options("Basic")
        ("h,help", "Display help information")
        ("v,version", "Display version information")
        ("l,list", "List available tasks")
        ("task", "Task to run (see --list)", cxxopts::value<std::string>())
        ("smiles", "Canonical SMILES of the compound", cxxopts::value<std::string>())
        ("json", "Print the result as JSON");

    options.add_options("Batch")
        ("i,input", "File with one SMILES per line", cxxopts::value<std::string>())
        ("o,output", "Output CSV file path", cxxopts::value<std::string>())
        ("t,threads", "Number of parallel threads (0=auto)", cxxopts::value<int>()->default_value("0"));

    options.add_options("Models")
        ("classifier", "Activity classifier model (RFBIN)",
            cxxopts::value<std::string>()->default_value(globalConfig.classifierModelPath))
        ("regressor", "pIC50 regressor model (RFBIN)",
            cxxopts::value<std::string>()->default_value(globalConfig.regressorModelPath));

    options.add_options("Descriptor tool")
        ("padel-script", "Script that runs PaDEL-Descriptor",
            cxxopts::value<std::string>()->default_value(globalConfig.featureScriptPath))
        ("tool-timeout", "Descriptor tool timeout in seconds",
            cxxopts::value<int>()->default_value(std::to_string(globalConfig.toolTimeoutSeconds)))
        ("min-features", "Minimum number of descriptor columns expected",
            cxxopts::value<size_t>()->default_value(std::to_string(globalConfig.minFeatureColumns)))
        ("temp-dir", "Parent directory for working directories",
            cxxopts::value<std::string>()->default_value(globalConfig.tempDir))
        ("keep-work-dirs", "Do not delete working directories");

    options.add_options("Protein search")
        ("search-url", "RCSB search endpoint",
            cxxopts::value<std::string>()->default_value(globalConfig.searchUrl))
        ("search-service", "Search service: full_text or chemical",
            cxxopts::value<std::string>()->default_value(globalConfig.searchService))
        ("search-timeout", "Search timeout in seconds",
            cxxopts::value<int>()->default_value(std::to_string(globalConfig.searchTimeoutSeconds)))
        ("max-proteins", "Maximum number of identifiers to report",
            cxxopts::value<size_t>()->default_value(std::to_string(globalConfig.maxProteins)))
        ("curl", "curl executable",
            cxxopts::value<std::string>()->default_value(globalConfig.curlPath));

    options.add_options("Logging")
        ("verbose", "Enable detailed logging output")
        ("log-level", "DEBUG, INFO, WARNING, ERROR or FATAL",
            cxxopts::value<std::string>()->default_value(globalConfig.logLevel));

    options.parse_positional({"task", "smiles"});
    options.positional_help("\033[1m<task>\033[0m \033[1m<smiles>\033[0m");
    options.set_width(100);

    if (argc == 1 || (argc > 1 && (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0))) {
        printHelp(options);
        return 0;
    }
    if (argc > 1 && (strcmp(argv[1], "-v") == 0 || strcmp(argv[1], "--version") == 0)) {
        printVersion();
        return 0;
    }

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) { printHelp(options); return 0; }
        if (result.count("version")) { printVersion(); return 0; }
        if (result.count("list")) { printTasks(); return 0; }

        globalConfig.numThreads = result["threads"].as<int>();
        globalConfig.verbose = result.count("verbose") > 0;
        globalConfig.logLevel = result["log-level"].as<std::string>();
        globalConfig.tempDir = result["temp-dir"].as<std::string>();
        globalConfig.keepWorkDirs = result.count("keep-work-dirs") > 0;
        globalConfig.classifierModelPath = result["classifier"].as<std::string>();
        globalConfig.regressorModelPath = result["regressor"].as<std::string>();
        globalConfig.featureScriptPath = result["padel-script"].as<std::string>();
        globalConfig.toolTimeoutSeconds = result["tool-timeout"].as<int>();
        globalConfig.minFeatureColumns = result["min-features"].as<size_t>();
        globalConfig.searchUrl = result["search-url"].as<std::string>();
        globalConfig.searchService = result["search-service"].as<std::string>();
        globalConfig.searchTimeoutSeconds = result["search-timeout"].as<int>();
        globalConfig.maxProteins = result["max-proteins"].as<size_t>();
        globalConfig.curlPath = result["curl"].as<std::string>();

        if (globalConfig.verbose) {
            globalLogger.setMinLevel(LogLevel::DEBUG);
            globalLogger.info("Verbose mode enabled.");
        } else {
            globalLogger.setMinLevel(parseLogLevel(globalConfig.logLevel));
            boost::logging::disable_logs("rdApp.*");
        }

        if (!result.count("task")) {
            std::cerr << "\033[1;31mError:\033[0m a task is required." << std::endl;
            printTasks();
            return 1;
        }
        Task task = parseTask(result["task"].as<std::string>());

        bool batchMode = result.count("input") > 0;
        if (batchMode && !result.count("output")) {
            std::cerr << "\033[1;31mError:\033[0m --input requires --output." << std::endl;
            return 1;
        }
        if (!batchMode && !result.count("smiles")) {
            std::cerr << "\033[1;31mError:\033[0m Enter Canonical SMILES." << std::endl;
            printHelp(options);
            return 1;
        }

        if (globalConfig.numThreads <= 0) {
            int availableCores = std::thread::hardware_concurrency();
            globalConfig.numThreads = availableCores > 1 ? availableCores - 1 : 1;
            globalLogger.info("Auto-configured to use " + std::to_string(globalConfig.numThreads) + " threads.");
        }

        #ifdef PFPRED_WITH_TBB
        tbb::global_control global_limit(
            tbb::global_control::max_allowed_parallelism,
            globalConfig.numThreads
        );
        globalLogger.debug("TBB configured with " + std::to_string(globalConfig.numThreads) + " threads");
        #endif

        PosixProcessRunner runner;
        LipinskiEngine lipinski;
        PadelFeatureGenerator padel(globalConfig, runner);
        ModelService models(globalConfig.classifierModelPath, globalConfig.regressorModelPath);
        RcsbProteinSearch rcsb(globalConfig, runner);
        ProteinRetriever retriever(rcsb, globalConfig.maxProteins);
        Orchestrator orchestrator(lipinski, padel, models, retriever);

        if (batchMode) {
            auto startTime = std::chrono::steady_clock::now();
            std::string outputPath = result["output"].as<std::string>();
            std::vector<std::string> smiles = readSmilesList(result["input"].as<std::string>());
            BatchSummary summary = runBatch(orchestrator, task, smiles, outputPath);
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startTime);

            std::cout << "\033[1;32m✓\033[0m " << taskDisplayName(task) << ": \033[1m" << summary.succeeded
                      << "\033[0m of " << summary.total << " molecules succeeded" << std::endl;
            std::cout << "\033[1;32m✓\033[0m Results written to \033[1m" << outputPath << "\033[0m" << std::endl;
            std::cout << "\033[1;32m✓\033[0m Total processing time: \033[1m" << (duration.count() / 1000.0)
                      << "\033[0m seconds" << std::endl;
            return summary.failed == 0 ? 0 : 1;
        }

        PipelineRequest request;
        request.smiles = result["smiles"].as<std::string>();
        request.task = task;
        PipelineResult outcome = orchestrator.run(request);

        if (result.count("json")) {
            std::cout << outcome.toJSON() << std::endl;
        } else if (outcome.ok()) {
            std::cout << outcome.output << std::endl;
        } else {
            std::cerr << "\033[1;31mError:\033[0m " << outcome.message << std::endl;
        }
        return outcome.ok() ? 0 : 1;

    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "\033[1;31mError parsing options:\033[0m " << e.what()
                  << " (see pfpredict --help)" << std::endl;
        return 1;
    } catch (const PredictionException& e) {
        std::cerr << "\033[1;31m" << errorCodeName(e.getCode()) << ":\033[0m " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\033[1;31mError:\033[0m " << e.what() << std::endl;
        return 1;
    }
}
