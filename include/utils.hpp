#pragma once

#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <mutex>
#include <ostream>
#include <iostream> // For default std::cout in Logger
#include <fstream>

// RDKit Forward Declarations
namespace RDKit {
    class ROMol;
    class RWMol;
}

namespace pfpred {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_STRUCTURE,
    EXTERNAL_TOOL_FAILURE,
    FEATURE_PARSE_FAILURE,
    MODEL_LOAD_FAILURE,
    FEATURE_SHAPE_MISMATCH,
    SEARCH_FAILURE,
    CANCELLED,
    IO_ERROR,
    UNKNOWN_ERROR
};

const char* errorCodeName(ErrorCode code);

class PredictionException : public std::runtime_error {
private:
    ErrorCode code;

public:
    PredictionException(const std::string& message, ErrorCode code = ErrorCode::UNKNOWN_ERROR);
    ErrorCode getCode() const;
};

struct Config {
    int numThreads = 1;
    bool verbose = false;
    std::string logLevel = "WARNING";
    std::string tempDir = "/tmp";
    bool keepWorkDirs = false;

    // Model artifacts
    std::string classifierModelPath = "models/lipinski_model.rfbin";
    std::string regressorModelPath = "models/pic50_model.rfbin";

    // External feature tool
    std::string featureScriptPath = "scripts/padel.sh";
    int toolTimeoutSeconds = 300;
    size_t minFeatureColumns = 1;

    // Protein search
    std::string searchUrl = "https://search.rcsb.org/rcsbsearch/v2/query";
    std::string searchService = "full_text";
    std::string curlPath = "curl";
    int searchTimeoutSeconds = 30;
    size_t searchPageSize = 25;
    size_t maxProteins = 10;
};

extern Config globalConfig;

namespace util {
    std::string trim(const std::string& str);
    std::string formatFixed(double value, int decimals);
}


enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

LogLevel parseLogLevel(const std::string& name);

class Logger {
private:
    LogLevel minLevel;
    std::mutex logMutex;
    std::ostream& out;
    std::ostream& err_out;
    bool colorEnabled;

    static const char* levelToString(LogLevel level);
    const char* levelToColor(LogLevel level);
    std::string formatMessage(LogLevel level, const std::string& message);

public:
    Logger(LogLevel minLevel = LogLevel::WARNING,
          std::ostream& out_stream = std::cout,
          std::ostream& err_stream = std::cerr,
          bool colorEnabled = true);

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    void setMinLevel(LogLevel level);
    LogLevel getMinLevel() const { return minLevel; }
};

extern Logger globalLogger;

// Temporary directory that lives for one request. Removed on destruction
// unless keep is set.
class WorkDir {
private:
    std::string dirPath;
    bool keep;

public:
    WorkDir(const std::string& parent, const std::string& prefix, bool keep = false);
    ~WorkDir();

    WorkDir(const WorkDir&) = delete;
    WorkDir& operator=(const WorkDir&) = delete;

    const std::string& path() const { return dirPath; }
    std::string file(const std::string& name) const;
};


class Molecule {
private:
    std::shared_ptr<RDKit::ROMol> mol;
    std::string smiles;
    std::string originalSmiles;
    bool valid;
    std::string errorMessage;

public:
    Molecule();
    explicit Molecule(const std::string& smiles);

    bool parse(const std::string& smiles);
    bool isValid() const;
    const std::string& getErrorMessage() const;

    std::shared_ptr<RDKit::ROMol> getMolecule() const;
    const std::string& getSmiles() const;
    const std::string& getOriginalSmiles() const;

    int getNumAtoms() const;
    int getNumBonds() const;

    std::string toJSON() const;

    // Throws INVALID_STRUCTURE instead of returning an invalid molecule.
    static Molecule validate(const std::string& smiles);
};

class MoleculeStream {
private:
    std::ifstream inputFile;
    std::string currentLine;
    size_t processedCount;
    bool isOpen;

public:
    explicit MoleculeStream(const std::string& filename);
    ~MoleculeStream();

    bool open(const std::string& filename);
    void close();
    bool good() const { return isOpen; }
    bool next(std::string& smiles);
    size_t getProcessedCount() const;
};

} // namespace pfpred
