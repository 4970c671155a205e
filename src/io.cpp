#include "io.hpp"
#include "utils.hpp" // Access to globalLogger
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <algorithm> // For std::find

namespace pfpred {

int CsvTable::columnIndex(const std::string& name) const {
    auto it = std::find(header.begin(), header.end(), name);
    return it == header.end() ? -1 : static_cast<int>(it - header.begin());
}

std::string CsvIO::trimQuotes(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v\"");
    if (std::string::npos == first) return ""; // Return empty if all quotes/whitespace
    size_t last = str.find_last_not_of(" \t\n\r\f\v\"");
    return str.substr(first, (last - first + 1));
}

// RFC 4180 quoting: a field may be wrapped in double quotes, and "" inside a
// quoted field is a literal quote. A quote in the middle of an unquoted field is kept.
std::vector<std::string> CsvIO::parseCsvLine(const std::string& line, const std::string& delimiter) {
    std::vector<std::string> cells;
    if (line.empty()) return cells;

    const char delim = delimiter.empty() ? ',' : delimiter[0];
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c != '"') {
                cell += c;
            } else if (i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else {
                quoted = false;
            }
        } else if (c == '"' && cell.empty()) {
            quoted = true;
        } else if (c == delim) {
            cells.push_back(std::move(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }

    cells.push_back(std::move(cell));
    return cells;
}

std::string CsvIO::quoteField(const std::string& field, const std::string& delimiter) {
    bool needsQuotes = field.find(delimiter) != std::string::npos ||
                       field.find('"') != std::string::npos ||
                       field.find_first_of(" \t\n\r") != std::string::npos;
    if (!needsQuotes) return field;

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += "\"\"";
        else quoted += c;
    }
    quoted += '"';
    return quoted;
}

static void stripLineEnding(std::string& line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
}

CsvTable CsvIO::readTable(const std::string& path, const std::string& delimiter) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PredictionException("CsvIO: Failed to open file: " + path, ErrorCode::IO_ERROR);
    }

    CsvTable table;
    std::string line;
    if (!std::getline(file, line)) {
        throw PredictionException("CsvIO: File is empty: " + path, ErrorCode::IO_ERROR);
    }
    // Handle potential UTF-8 BOM
    if (line.size() >= 3 && line.rfind("\xEF\xBB\xBF", 0) == 0) {
        line = line.substr(3);
    }
    stripLineEnding(line);

    for (const auto& cell : parseCsvLine(line, delimiter)) {
        table.header.push_back(trimQuotes(cell));
    }
    if (table.header.empty()) {
        throw PredictionException("CsvIO: Header line parsed into zero columns: " + path,
                                  ErrorCode::IO_ERROR);
    }

    while (std::getline(file, line)) {
        stripLineEnding(line);
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        table.rows.push_back(parseCsvLine(line, delimiter));
    }

    globalLogger.debug("CsvIO: Read " + std::to_string(table.header.size()) + " columns and " +
                       std::to_string(table.rows.size()) + " rows from " + path);
    return table;
}

void CsvIO::writeSmilesFile(const std::string& path, const std::string& smiles,
                            const std::string& name) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw PredictionException("CsvIO: Failed to open " + path + " for writing: " +
                                  std::strerror(errno), ErrorCode::IO_ERROR);
    }
    file << smiles << '\t' << name << '\n';
    file.flush();
    if (!file) {
        throw PredictionException("CsvIO: Failed to write " + path, ErrorCode::IO_ERROR);
    }
}

// --- ResultWriter ---
CsvIO::ResultWriter::ResultWriter(const std::string& outFilePath, const std::string& delimiter,
                                  const std::vector<std::string>& headers)
    : outputPath(outFilePath), delimiter(delimiter) {
    fileStream.open(outputPath, std::ios::out | std::ios::trunc);
    if (!fileStream.is_open()) {
        throw PredictionException("ResultWriter: Failed to open output file: " + outputPath,
                                  ErrorCode::IO_ERROR);
    }
    writeRow(headers);
}

CsvIO::ResultWriter::~ResultWriter() {
    if (fileStream.is_open()) {
        fileStream.flush();
        fileStream.close();
    }
}

bool CsvIO::ResultWriter::writeRow(const std::vector<std::string>& cells) {
    std::lock_guard<std::mutex> lock(writeMutex);

    if (!fileStream.is_open()) {
        globalLogger.error("ResultWriter::writeRow: Output file stream is not open.");
        return false;
    }

    std::ostringstream rowStream;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) rowStream << delimiter;
        rowStream << quoteField(cells[i], delimiter);
    }
    rowStream << "\n"; // Use '\n' consistently
    fileStream << rowStream.str();
    return static_cast<bool>(fileStream);
}

void CsvIO::ResultWriter::flush() {
    std::lock_guard<std::mutex> lock(writeMutex);
    if (fileStream.is_open()) {
        fileStream.flush();
    }
}

} // namespace pfpred
