#pragma once

#include "descriptors.hpp"
#include "io.hpp"
#include "process.hpp"
#include "utils.hpp"
#include <Eigen/Dense>
#include <atomic>
#include <string>
#include <vector>

namespace pfpred {

// Named numeric feature table, one row per compound.
struct FeatureMatrix {
    using Matrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    std::vector<std::string> columnNames;
    std::vector<std::string> rowNames;
    Matrix values;

    size_t rows() const { return static_cast<size_t>(values.rows()); }
    size_t cols() const { return static_cast<size_t>(values.cols()); }
    std::vector<double> row(size_t i) const;

    // The name column becomes the row names and is dropped from the values.
    // Throws FEATURE_PARSE_FAILURE on a missing name column, ragged rows or
    // non-numeric cells.
    static FeatureMatrix fromTable(const CsvTable& table, const std::string& nameColumn);
    static FeatureMatrix fromDescriptors(const DescriptorVector& descriptors, const std::string& rowName);
};

// Computes a feature matrix for a single molecule.
class FeatureGenerator {
public:
    virtual ~FeatureGenerator() = default;
    virtual std::string getName() const = 0;
    virtual FeatureMatrix generate(const Molecule& mol, const std::atomic<bool>* cancelled = nullptr) = 0;
};

// Runs an external PaDEL-Descriptor wrapper script in a fresh working
// directory: molecule.smi in, descriptors_output.csv out.
class PadelFeatureGenerator : public FeatureGenerator {
private:
    const Config& config;
    ProcessRunner& runner;

public:
    static constexpr const char* kInputFile = "molecule.smi";
    static constexpr const char* kOutputFile = "descriptors_output.csv";
    static constexpr const char* kLogFile = "padel.log";
    static constexpr const char* kCompoundName = "Compound_name";
    static constexpr const char* kNameColumn = "Name";

    PadelFeatureGenerator(const Config& config, ProcessRunner& runner);

    std::string getName() const override { return "PaDEL-Descriptor"; }
    FeatureMatrix generate(const Molecule& mol, const std::atomic<bool>* cancelled = nullptr) override;

    // Parses the tool output; requires exactly one data row and at least
    // minColumns feature columns.
    static FeatureMatrix parseOutput(const std::string& path, size_t minColumns);
};

} // namespace pfpred
