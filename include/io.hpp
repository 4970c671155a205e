#pragma once

#include "utils.hpp" // Include for Logger, PredictionException
#include <string>
#include <vector>
#include <fstream>
#include <mutex>

namespace pfpred {

struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    // -1 when the column is absent
    int columnIndex(const std::string& name) const;
};

class CsvIO {
public:
    static std::vector<std::string> parseCsvLine(const std::string& line, const std::string& delimiter);
    static std::string trimQuotes(const std::string& str);
    static std::string quoteField(const std::string& field, const std::string& delimiter);

    // Reads a delimited file with a header line. Blank lines are skipped.
    static CsvTable readTable(const std::string& path, const std::string& delimiter = ",");

    // Single "<smiles>\t<name>" line, no header
    static void writeSmilesFile(const std::string& path, const std::string& smiles,
                                const std::string& name);

    class ResultWriter {
    private:
        std::string outputPath;
        std::ofstream fileStream;
        std::string delimiter;
        std::mutex writeMutex;

    public:
        ResultWriter(const std::string& outFilePath, const std::string& delimiter,
                     const std::vector<std::string>& headers);
        ~ResultWriter();

        bool writeRow(const std::vector<std::string>& cells);
        void flush();
    };
};

} // namespace pfpred
