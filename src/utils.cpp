#include "utils.hpp"

// RDKit includes for implementation
#include <GraphMol/GraphMol.h>
#include <GraphMol/SmilesParse/SmilesParse.h>
#include <GraphMol/SmilesParse/SmilesWrite.h>
#include <GraphMol/SanitException.h>

// RapidJSON includes for Molecule JSON
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <unistd.h>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace pfpred {

// --- Global Variables ---
Config globalConfig;
Logger globalLogger(LogLevel::WARNING, std::cout, std::cerr, true);

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:                return "Success";
        case ErrorCode::INVALID_STRUCTURE:      return "InvalidStructure";
        case ErrorCode::EXTERNAL_TOOL_FAILURE:  return "ExternalToolFailure";
        case ErrorCode::FEATURE_PARSE_FAILURE:  return "FeatureParseFailure";
        case ErrorCode::MODEL_LOAD_FAILURE:     return "ModelLoadFailure";
        case ErrorCode::FEATURE_SHAPE_MISMATCH: return "FeatureShapeMismatch";
        case ErrorCode::SEARCH_FAILURE:         return "SearchFailure";
        case ErrorCode::CANCELLED:              return "Cancelled";
        case ErrorCode::IO_ERROR:               return "IOError";
        default:                                return "UnknownError";
    }
}

// --- PredictionException ---
PredictionException::PredictionException(const std::string& message, ErrorCode code)
    : std::runtime_error(message), code(code) {}

ErrorCode PredictionException::getCode() const { return code; }

// --- Utility Functions ---
namespace util {

    std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r\f\v");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\n\r\f\v");
        return str.substr(first, last - first + 1);
    }

    std::string formatFixed(double value, int decimals) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(decimals) << value;
        return ss.str();
    }
}

LogLevel parseLogLevel(const std::string& name) {
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO") return LogLevel::INFO;
    if (name == "WARNING") return LogLevel::WARNING;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "FATAL") return LogLevel::FATAL;
    throw std::invalid_argument("Unknown log level: " + name);
}

// --- Logger Implementation ---
Logger::Logger(LogLevel minLevel, std::ostream& out_stream, std::ostream& err_stream, bool colorEnabled)
    : minLevel(minLevel), out(out_stream), err_out(err_stream), colorEnabled(colorEnabled) {}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

const char* Logger::levelToColor(LogLevel level) {
    bool useEffectiveColor = colorEnabled && isatty(fileno(stderr));
    if (!useEffectiveColor) return "";

    switch (level) {
        case LogLevel::DEBUG:   return "\033[38;5;250m"; // Lighter gray
        case LogLevel::INFO:    return "\033[38;5;44m";  // Sea green
        case LogLevel::WARNING: return "\033[38;5;208m"; // Soft orange
        case LogLevel::ERROR:   return "\033[38;5;203m"; // Soft red
        case LogLevel::FATAL:   return "\033[38;5;199m"; // Soft magenta
        default:                return "\033[0m";        // Reset
    }
}

std::string Logger::formatMessage(LogLevel level, const std::string& message) {
    const char* levelStr = levelToString(level);
    std::stringstream ss;
    const char* color = levelToColor(level);
    const char* reset = (color[0] == '\0') ? "" : "\033[0m"; // Only reset if color was applied
    ss << color << "[" << levelStr << "]" << reset << " " << message;
    return ss.str();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < minLevel) return;
    std::lock_guard<std::mutex> lock(logMutex);

    std::ostream& target_out = (level >= LogLevel::WARNING) ? err_out : out;
    target_out << formatMessage(level, message) << std::endl;
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { log(LogLevel::INFO, message); }
void Logger::warning(const std::string& message) { log(LogLevel::WARNING, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }
void Logger::fatal(const std::string& message) { log(LogLevel::FATAL, message); }

void Logger::setMinLevel(LogLevel level) { minLevel = level; }

// --- WorkDir Implementation ---
WorkDir::WorkDir(const std::string& parent, const std::string& prefix, bool keep) : keep(keep) {
    std::string pattern = (std::filesystem::path(parent) / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        throw PredictionException("Cannot create working directory under " + parent + ": " +
                                  std::strerror(errno), ErrorCode::IO_ERROR);
    }
    dirPath = buffer.data();
    globalLogger.debug("Created working directory " + dirPath);
}

WorkDir::~WorkDir() {
    if (keep) {
        globalLogger.info("Keeping working directory " + dirPath);
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(dirPath, ec);
    if (ec) {
        globalLogger.warning("Failed to remove working directory " + dirPath + ": " + ec.message());
    }
}

std::string WorkDir::file(const std::string& name) const {
    return (std::filesystem::path(dirPath) / name).string();
}


// --- Molecule Implementation ---
Molecule::Molecule() : valid(false) {}

Molecule::Molecule(const std::string& smilesStr) : originalSmiles(smilesStr), valid(false) {
    parse(smilesStr);
}

bool Molecule::parse(const std::string& smilesStr) {
    originalSmiles = smilesStr; // Store the input smiles regardless of validity
    mol = nullptr;
    valid = false;
    errorMessage = "";

    if (util::trim(smilesStr).empty()) {
        errorMessage = "Input SMILES string is empty.";
        return false;
    }
    // RDKit would treat anything after whitespace as a molecule name
    if (smilesStr.find_first_of(" \t\r\n") != std::string::npos) {
        errorMessage = "SMILES '" + smilesStr + "' contains whitespace.";
        return false;
    }

    try {
        RDKit::RWMol* rawMol = RDKit::SmilesToMol(smilesStr);
        if (!rawMol) {
            errorMessage = "RDKit failed to parse SMILES '" + smilesStr + "'.";
            return false;
        }
        mol.reset(rawMol);
        if (mol->getNumAtoms() == 0) {
            errorMessage = "SMILES '" + smilesStr + "' contains no atoms.";
            mol = nullptr;
            return false;
        }
        smiles = RDKit::MolToSmiles(*mol); // Generate canonical SMILES after successful parse
        valid = true;
        return true;
    } catch (const RDKit::MolSanitizeException& e) {
        errorMessage = "RDKit Sanity Exception during SMILES parse: " + std::string(e.what());
        mol = nullptr; // Ensure mol is null on failure
        return false;
    } catch (const std::exception& e) {
        errorMessage = "Error parsing SMILES: " + std::string(e.what());
        mol = nullptr;
        return false;
    }
}

bool Molecule::isValid() const { return valid; }
const std::string& Molecule::getErrorMessage() const { return errorMessage; }
std::shared_ptr<RDKit::ROMol> Molecule::getMolecule() const { return mol; }
const std::string& Molecule::getSmiles() const { return smiles; }
const std::string& Molecule::getOriginalSmiles() const { return originalSmiles; }

int Molecule::getNumAtoms() const { return (valid && mol) ? mol->getNumAtoms() : 0; }
int Molecule::getNumBonds() const { return (valid && mol) ? mol->getNumBonds() : 0; }

std::string Molecule::toJSON() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("smiles"); writer.String(smiles.c_str());
    writer.Key("original_smiles"); writer.String(originalSmiles.c_str());
    writer.Key("valid"); writer.Bool(valid);
    if (!valid) {
        writer.Key("error_message"); writer.String(errorMessage.c_str());
    }
    writer.Key("num_atoms"); writer.Int(getNumAtoms());
    writer.Key("num_bonds"); writer.Int(getNumBonds());
    writer.EndObject();
    return buffer.GetString();
}

Molecule Molecule::validate(const std::string& smilesStr) {
    Molecule molecule(smilesStr);
    if (!molecule.isValid()) {
        throw PredictionException(molecule.getErrorMessage(), ErrorCode::INVALID_STRUCTURE);
    }
    return molecule;
}

// --- MoleculeStream Implementation ---
MoleculeStream::MoleculeStream(const std::string& filename) : processedCount(0), isOpen(false) {
    open(filename);
}

MoleculeStream::~MoleculeStream() {
    close();
}

bool MoleculeStream::open(const std::string& filename) {
    if (isOpen) {
        close();
    }

    inputFile.open(filename);
    isOpen = inputFile.is_open();

    if (!isOpen) {
        globalLogger.error("Failed to open file: " + filename);
    }

    processedCount = 0;
    return isOpen;
}

void MoleculeStream::close() {
    if (isOpen) {
        inputFile.close();
        isOpen = false;
    }
}

// Yields the first whitespace-separated token of each non-blank line.
// Parsing is left to the caller so invalid rows are still reported.
bool MoleculeStream::next(std::string& smiles) {
    if (!isOpen) return false;

    while (std::getline(inputFile, currentLine)) {
        std::string line = util::trim(currentLine);
        if (line.empty()) {
            continue;
        }

        size_t firstSpace = line.find_first_of(" \t");
        smiles = (firstSpace != std::string::npos) ? line.substr(0, firstSpace) : line;
        processedCount++;
        return true;
    }

    return false;
}

size_t MoleculeStream::getProcessedCount() const {
    return processedCount;
}

} // namespace pfpred
