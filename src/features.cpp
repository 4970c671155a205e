#include "features.hpp"
#include "utils.hpp"
#include <filesystem>

namespace pfpred {

std::vector<double> FeatureMatrix::row(size_t i) const {
    if (i >= rows()) {
        throw std::out_of_range("FeatureMatrix row " + std::to_string(i) + " out of range");
    }
    std::vector<double> result(cols());
    for (size_t j = 0; j < cols(); ++j) {
        result[j] = values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
    }
    return result;
}

static double parseNumericCell(const std::string& cell, const std::string& column, size_t rowIndex) {
    std::string text = CsvIO::trimQuotes(cell);
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (text.empty() || consumed != text.size()) {
        throw PredictionException("Non-numeric value '" + cell + "' in column '" + column +
                                  "' of row " + std::to_string(rowIndex + 1),
                                  ErrorCode::FEATURE_PARSE_FAILURE);
    }
    return value;
}

FeatureMatrix FeatureMatrix::fromTable(const CsvTable& table, const std::string& nameColumn) {
    int nameIndex = table.columnIndex(nameColumn);
    if (nameIndex < 0) {
        throw PredictionException("Feature table has no '" + nameColumn + "' column",
                                  ErrorCode::FEATURE_PARSE_FAILURE);
    }

    FeatureMatrix matrix;
    for (size_t j = 0; j < table.header.size(); ++j) {
        if (static_cast<int>(j) != nameIndex) {
            matrix.columnNames.push_back(table.header[j]);
        }
    }

    matrix.values.resize(static_cast<Eigen::Index>(table.rows.size()),
                         static_cast<Eigen::Index>(matrix.columnNames.size()));

    for (size_t i = 0; i < table.rows.size(); ++i) {
        const auto& cells = table.rows[i];
        if (cells.size() != table.header.size()) {
            throw PredictionException("Row " + std::to_string(i + 1) + " has " +
                                      std::to_string(cells.size()) + " cells, header has " +
                                      std::to_string(table.header.size()),
                                      ErrorCode::FEATURE_PARSE_FAILURE);
        }

        Eigen::Index col = 0;
        for (size_t j = 0; j < cells.size(); ++j) {
            if (static_cast<int>(j) == nameIndex) {
                matrix.rowNames.push_back(CsvIO::trimQuotes(cells[j]));
                continue;
            }
            matrix.values(static_cast<Eigen::Index>(i), col++) = parseNumericCell(cells[j], table.header[j], i);
        }
    }
    return matrix;
}

FeatureMatrix FeatureMatrix::fromDescriptors(const DescriptorVector& descriptors, const std::string& rowName) {
    FeatureMatrix matrix;
    matrix.columnNames = descriptors.names;
    matrix.rowNames.push_back(rowName);
    matrix.values.resize(1, static_cast<Eigen::Index>(descriptors.size()));
    for (size_t j = 0; j < descriptors.size(); ++j) {
        matrix.values(0, static_cast<Eigen::Index>(j)) = descriptors.values[j];
    }
    return matrix;
}

PadelFeatureGenerator::PadelFeatureGenerator(const Config& config, ProcessRunner& runner)
    : config(config), runner(runner) {}

FeatureMatrix PadelFeatureGenerator::generate(const Molecule& mol, const std::atomic<bool>* cancelled) {
    std::error_code ec;
    std::filesystem::path script = std::filesystem::absolute(config.featureScriptPath, ec);
    if (ec || !std::filesystem::exists(script)) {
        throw PredictionException("Feature script not found: " + config.featureScriptPath,
                                  ErrorCode::EXTERNAL_TOOL_FAILURE);
    }

    WorkDir workDir(config.tempDir, "pfpred-padel-", config.keepWorkDirs);
    CsvIO::writeSmilesFile(workDir.file(kInputFile), mol.getOriginalSmiles(), kCompoundName);

    ProcessRequest request;
    request.argv = {"bash", script.string()};
    request.workingDirectory = workDir.path();
    request.logPath = workDir.file(kLogFile);
    request.timeout = std::chrono::seconds(config.toolTimeoutSeconds);
    request.cancelled = cancelled;

    ProcessResult result = runner.run(request);
    if (!result.success()) {
        globalLogger.error(getName() + " failed for " + mol.getOriginalSmiles() + ": " + describe(result));
        throw PredictionException(getName() + " " + describe(result), ErrorCode::EXTERNAL_TOOL_FAILURE);
    }
    globalLogger.info(getName() + " finished for " + mol.getOriginalSmiles());

    return parseOutput(workDir.file(kOutputFile), config.minFeatureColumns);
}

FeatureMatrix PadelFeatureGenerator::parseOutput(const std::string& path, size_t minColumns) {
    CsvTable table;
    try {
        table = CsvIO::readTable(path, ",");
    } catch (const PredictionException& e) {
        throw PredictionException(e.what(), ErrorCode::FEATURE_PARSE_FAILURE);
    }

    FeatureMatrix matrix = FeatureMatrix::fromTable(table, kNameColumn);
    if (matrix.rows() != 1) {
        throw PredictionException("Expected exactly one row in " + path + ", found " +
                                  std::to_string(matrix.rows()), ErrorCode::FEATURE_PARSE_FAILURE);
    }
    if (matrix.cols() < minColumns) {
        throw PredictionException("Expected at least " + std::to_string(minColumns) +
                                  " feature columns in " + path + ", found " +
                                  std::to_string(matrix.cols()), ErrorCode::FEATURE_PARSE_FAILURE);
    }

    globalLogger.debug("Parsed " + std::to_string(matrix.cols()) + " features from " + path);
    return matrix;
}

} // namespace pfpred
