#include "ffpfact/utils.hpp"

#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace ffpfact {

// --- Global Variables ---
Config globalConfig;
Logger globalLogger(LogLevel::WARNING, std::cout, std::cerr, true);

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:                 return "SUCCESS";
        case ErrorCode::PARSE_ERROR:             return "PARSE_ERROR";
        case ErrorCode::IO_ERROR:                return "IO_ERROR";
        case ErrorCode::INVALID_ARGUMENT:        return "INVALID_ARGUMENT";
        case ErrorCode::UNKNOWN_SPECIES:         return "UNKNOWN_SPECIES";
        case ErrorCode::EMPTY_SHELL:             return "EMPTY_SHELL";
        case ErrorCode::DEGENERATE_TESSELLATION: return "DEGENERATE_TESSELLATION";
        case ErrorCode::UNSUPPORTED_PRECURSOR:   return "UNSUPPORTED_PRECURSOR";
        case ErrorCode::CALCULATION_ERROR:       return "CALCULATION_ERROR";
        default:                                 return "UNKNOWN_ERROR";
    }
}

// --- Exceptions ---
DescriptorException::DescriptorException(const std::string& message, ErrorCode code)
    : std::runtime_error(message), code(code) {}

ErrorCode DescriptorException::getCode() const { return code; }

UnknownSpeciesError::UnknownSpeciesError(const std::string& message, int atomicNumber)
    : DescriptorException(message, ErrorCode::UNKNOWN_SPECIES), atomicNumber(atomicNumber) {}

SiteError::SiteError(const std::string& message, ErrorCode code, std::size_t siteIndex)
    : DescriptorException(message, code), siteIndex(siteIndex) {}

EmptyShellError::EmptyShellError(const std::string& message, std::size_t siteIndex, int shell)
    : SiteError(message, ErrorCode::EMPTY_SHELL, siteIndex), shell(shell) {}

DegenerateTessellationError::DegenerateTessellationError(const std::string& message, std::size_t siteIndex)
    : SiteError(message, ErrorCode::DEGENERATE_TESSELLATION, siteIndex) {}

UnsupportedPrecursorError::UnsupportedPrecursorError(const std::string& identifier)
    : DescriptorException("Unsupported force-field precursor type: '" + identifier + "'",
                          ErrorCode::UNSUPPORTED_PRECURSOR),
      identifier(identifier) {}

// --- Utility Functions ---
namespace util {
    std::string trim(const std::string& text) {
        size_t first = text.find_first_not_of(" \t\n\r\f\v");
        if (first == std::string::npos) return "";
        size_t last = text.find_last_not_of(" \t\n\r\f\v");
        return text.substr(first, last - first + 1);
    }

    std::vector<std::string> splitList(const std::string& text, char separator) {
        std::vector<std::string> items;
        std::stringstream ss(text);
        std::string item;
        while (std::getline(ss, item, separator)) {
            item = trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    std::string readFile(const std::string& path) {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            throw DescriptorException("Failed to open file: " + path, ErrorCode::IO_ERROR);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            throw DescriptorException("Failed to read file: " + path, ErrorCode::IO_ERROR);
        }
        return buffer.str();
    }
}

LogLevel parseLogLevel(const std::string& name) {
    std::string upper = util::trim(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    throw DescriptorException("Unknown log level: " + name, ErrorCode::INVALID_ARGUMENT);
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

const char* Logger::levelToColor(LogLevel level) const {
    bool useEffectiveColor = colorEnabled && isatty(fileno(stderr));
    if (!useEffectiveColor) return "";

    switch (level) {
        case LogLevel::DEBUG:   return "\033[38;5;250m"; // Lighter gray
        case LogLevel::INFO:    return "\033[38;5;44m";  // Sea green
        case LogLevel::WARNING: return "\033[38;5;208m"; // Soft orange
        case LogLevel::ERROR:   return "\033[38;5;203m"; // Soft red
        case LogLevel::FATAL:   return "\033[38;5;199m"; // Soft magenta
        default:                return "\033[0m";
    }
}

std::string Logger::formatMessage(LogLevel level, const std::string& message) const {
    const char* color = levelToColor(level);
    const char* reset = (color[0] == '\0') ? "" : "\033[0m";
    std::stringstream ss;
    ss << color << "[" << levelToString(level) << "]" << reset << " " << message;
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
void Logger::enableColor(bool enable) { colorEnabled = enable; }

} // namespace ffpfact
