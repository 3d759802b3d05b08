#pragma once

#include "ffpfact/descriptors.hpp"
#include "ffpfact/utils.hpp"

#include <fstream>
#include <limits>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace ffpfact {

// Writes feature matrices as CSV: structure,site,<feature labels...>
// The header is emitted before the first row; every structure shares the same labels.
class FeatureWriter {
private:
    // Enough significant digits for every double to read back unchanged
    static constexpr int PRECISION = std::numeric_limits<double>::max_digits10;

    std::string outputPath;
    std::ofstream fileStream;
    std::ostream* out;
    std::string delimiter;
    std::vector<std::string> labels;
    std::mutex writeMutex;
    bool headerWritten;
    std::size_t rowsWritten;

    void writeHeader(std::ostream& stream) const;

public:
    FeatureWriter(const std::string& outFilePath, const std::vector<std::string>& labels,
                  const std::string& delimiter = ",");
    // Writes to a caller-owned stream, which must outlive the writer
    FeatureWriter(std::ostream& stream, const std::vector<std::string>& labels,
                  const std::string& delimiter = ",");
    ~FeatureWriter();

    FeatureWriter(const FeatureWriter&) = delete;
    FeatureWriter& operator=(const FeatureWriter&) = delete;

    // Throws DescriptorException when the labels differ from the writer's or a value is not finite
    void writeStructure(const std::string& structureName, const FeatureMatrix& features);

    std::size_t getRowsWritten() const { return rowsWritten; }
    void flush();

    // RFC 4180 quoting when the cell holds the delimiter, a quote or whitespace
    static std::string quoteCell(const std::string& cell, const std::string& delimiter = ",");
};

} // namespace ffpfact
