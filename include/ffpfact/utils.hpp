#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <mutex>
#include <cstddef>
#include <ostream>
#include <iostream> // For default std::cout in Logger

namespace ffpfact {

enum class ErrorCode {
    SUCCESS = 0,
    PARSE_ERROR,
    IO_ERROR,
    INVALID_ARGUMENT,
    UNKNOWN_SPECIES,
    EMPTY_SHELL,
    DEGENERATE_TESSELLATION,
    UNSUPPORTED_PRECURSOR,
    CALCULATION_ERROR,
    UNKNOWN_ERROR
};

const char* errorCodeName(ErrorCode code);

class DescriptorException : public std::runtime_error {
private:
    ErrorCode code;

public:
    DescriptorException(const std::string& message, ErrorCode code = ErrorCode::UNKNOWN_ERROR);
    ErrorCode getCode() const;
};

// Covalent radius or elemental property lookup miss. Always fatal for the structure.
class UnknownSpeciesError : public DescriptorException {
private:
    int atomicNumber;

public:
    UnknownSpeciesError(const std::string& message, int atomicNumber = 0);
    int getAtomicNumber() const { return atomicNumber; }
};

// Failure bound to a single site; callers may abort the structure or drop the site.
class SiteError : public DescriptorException {
private:
    std::size_t siteIndex;

public:
    SiteError(const std::string& message, ErrorCode code, std::size_t siteIndex);
    std::size_t getSiteIndex() const { return siteIndex; }
};

class EmptyShellError : public SiteError {
private:
    int shell;

public:
    EmptyShellError(const std::string& message, std::size_t siteIndex, int shell);
    // 1 for the first neighbour shell, 2 for the second
    int getShell() const { return shell; }
};

class DegenerateTessellationError : public SiteError {
public:
    DegenerateTessellationError(const std::string& message, std::size_t siteIndex);
};

class UnsupportedPrecursorError : public DescriptorException {
private:
    std::string identifier;

public:
    explicit UnsupportedPrecursorError(const std::string& identifier);
    const std::string& getIdentifier() const { return identifier; }
};

struct Config {
    int numThreads = 1;
    bool verbose = false;
    std::string logLevel = "WARNING";
};

extern Config globalConfig;

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
    const char* levelToColor(LogLevel level) const;
    std::string formatMessage(LogLevel level, const std::string& message) const;

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
    void enableColor(bool enable);
};

extern Logger globalLogger;

namespace util {
    // Splits a comma separated list, trimming whitespace and dropping empty items
    std::vector<std::string> splitList(const std::string& text, char separator = ',');
    std::string trim(const std::string& text);
    // Whole file contents; throws DescriptorException(IO_ERROR) when unreadable
    std::string readFile(const std::string& path);
}

} // namespace ffpfact
