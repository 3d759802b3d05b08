#include "ffpfact/io.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace ffpfact {

std::string FeatureWriter::quoteCell(const std::string& cell, const std::string& delimiter) {
    bool needsQuotes = cell.find(delimiter) != std::string::npos ||
                       cell.find('"') != std::string::npos ||
                       cell.find_first_of(" \t\n\r") != std::string::npos;
    if (!needsQuotes) return cell;

    std::string quoted;
    quoted.reserve(cell.size() + 2);
    quoted.push_back('"');
    for (char c : cell) {
        if (c == '"') quoted += "\"\""; // Standard escaping
        else quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

FeatureWriter::FeatureWriter(const std::string& outFilePath, const std::vector<std::string>& labels,
                             const std::string& delimiter)
    : outputPath(outFilePath), fileStream(), out(nullptr), delimiter(delimiter), labels(labels),
      writeMutex(), headerWritten(false), rowsWritten(0) {
    fileStream.open(outFilePath, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!fileStream.is_open()) {
        throw DescriptorException("FeatureWriter: Failed to open output file: " + outFilePath, ErrorCode::IO_ERROR);
    }
    out = &fileStream;
    globalLogger.info("FeatureWriter: Initialized for output file: " + outFilePath);
}

FeatureWriter::FeatureWriter(std::ostream& stream, const std::vector<std::string>& labels,
                             const std::string& delimiter)
    : outputPath(), fileStream(), out(&stream), delimiter(delimiter), labels(labels),
      writeMutex(), headerWritten(false), rowsWritten(0) {}

FeatureWriter::~FeatureWriter() {
    if (fileStream.is_open()) {
        fileStream.flush();
        fileStream.close();
        globalLogger.debug("FeatureWriter: Closed output file stream.");
    }
}

void FeatureWriter::writeHeader(std::ostream& stream) const {
    stream << "structure" << delimiter << "site";
    for (const auto& label : labels) {
        stream << delimiter << quoteCell(label, delimiter);
    }
    stream << "\n";
}

void FeatureWriter::writeStructure(const std::string& structureName, const FeatureMatrix& features) {
    if (features.labels != labels) {
        throw DescriptorException("FeatureWriter: feature labels of structure '" + structureName +
                                  "' do not match the output columns", ErrorCode::INVALID_ARGUMENT);
    }
    if (static_cast<std::size_t>(features.values.rows()) != features.rows() ||
        static_cast<std::size_t>(features.values.cols()) != features.cols()) {
        throw DescriptorException("FeatureWriter: feature matrix of structure '" + structureName +
                                  "' does not match its row and column labels", ErrorCode::INVALID_ARGUMENT);
    }

    std::lock_guard<std::mutex> lock(writeMutex);

    std::ostringstream batchBuffer;
    if (!headerWritten) {
        writeHeader(batchBuffer);
    }

    const std::string name = quoteCell(structureName, delimiter);
    batchBuffer << std::setprecision(PRECISION);
    for (std::size_t row = 0; row < features.rows(); ++row) {
        batchBuffer << name << delimiter << features.siteIndices[row];
        for (Eigen::Index col = 0; col < features.values.cols(); ++col) {
            const double value = features.values(static_cast<Eigen::Index>(row), col);
            if (!std::isfinite(value)) {
                throw DescriptorException("FeatureWriter: non-finite value for structure '" + structureName +
                                          "', site " + std::to_string(features.siteIndices[row]) +
                                          ", column '" + labels[static_cast<std::size_t>(col)] + "'",
                                          ErrorCode::CALCULATION_ERROR);
            }
            batchBuffer << delimiter << value;
        }
        batchBuffer << "\n";
    }

    *out << batchBuffer.str();
    if (!out->good()) {
        throw DescriptorException("FeatureWriter: stream error while writing structure '" + structureName + "'",
                                  ErrorCode::IO_ERROR);
    }
    headerWritten = true;
    rowsWritten += features.rows();
}

void FeatureWriter::flush() {
    std::lock_guard<std::mutex> lock(writeMutex);
    out->flush();
}

} // namespace ffpfact
