#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace ionbench {

/**
 * @brief Root of every error raised by the benchmarking engine.
 *
 * The message reads `[function] Category: details`, prefixed with `file:line` when the
 * exception was raised through one of the THROW_* macros.
 */
class BenchmarkException : public std::runtime_error {
public:
    BenchmarkException(const std::string& functionName, const std::string& message)
        : BenchmarkException(nullptr, 0, functionName, "", message) {}

    BenchmarkException(const char* file, int line, const std::string& functionName,
                       const std::string& category, const std::string& message)
        : std::runtime_error(compose(file, line, functionName, category, message)),
          functionName_(functionName), category_(category) {}

    const std::string& functionName() const { return functionName_; }
    const std::string& category() const { return category_; }

private:
    static std::string compose(const char* file, int line, const std::string& functionName,
                               const std::string& category, const std::string& message) {
        std::string text;
        if (file != nullptr) {
            text += std::string(file) + ":" + std::to_string(line) + " ";
        }
        text += "[" + functionName + "] ";
        if (!category.empty()) {
            text += category + ": ";
        }
        return text + message;
    }

    std::string functionName_;
    std::string category_;
};

/**
 * @brief Wrong vector length or otherwise unusable argument.
 */
class InvalidParameterException : public BenchmarkException {
public:
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : BenchmarkException(nullptr, 0, functionName, "Invalid Parameter", message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : BenchmarkException(file, line, functionName, "Invalid Parameter", message) {}
};

/**
 * @brief Failed or invalid simulator run.
 *
 * Raised by simulators and absorbed by CachedEvaluator, which scores the candidate as +inf.
 */
class SimulationException : public BenchmarkException {
public:
    SimulationException(const std::string& functionName, const std::string& message)
        : BenchmarkException(nullptr, 0, functionName, "Simulation Error", message) {}
    SimulationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : BenchmarkException(file, line, functionName, "Simulation Error", message) {}
};

/**
 * @brief Malformed transform flags, bounds, default parameters or optimiser settings.
 *
 * Always fatal.
 */
class ConfigurationException : public BenchmarkException {
public:
    ConfigurationException(const std::string& functionName, const std::string& message)
        : BenchmarkException(nullptr, 0, functionName, "Configuration Error", message) {}
    ConfigurationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : BenchmarkException(file, line, functionName, "Configuration Error", message) {}
};

/**
 * @brief Logarithm of a non-positive value in a parameter transform.
 */
class TransformDomainException : public BenchmarkException {
public:
    TransformDomainException(const std::string& functionName, const std::string& message)
        : BenchmarkException(nullptr, 0, functionName, "Transform Domain Error", message) {}
    TransformDomainException(const char* file, int line, const std::string& functionName, const std::string& message)
        : BenchmarkException(file, line, functionName, "Transform Domain Error", message) {}
};

/**
 * @brief Index past the end of a protocol or parameter vector.
 */
class OutOfRangeException : public BenchmarkException {
public:
    OutOfRangeException(const char* file, int line, const std::string& functionName, const std::string& message)
        : BenchmarkException(file, line, functionName, "Out Of Range", message) {}
};

/**
 * @brief Settings, bounds or data file that cannot be opened.
 */
class FileIOException : public BenchmarkException {
public:
    FileIOException(const std::string& functionName, const std::string& message)
        : BenchmarkException(nullptr, 0, functionName, "File IO Error", message) {}
};

/**
 * @brief Malformed line or value in a settings, bounds or data file.
 */
class DataFormatException : public BenchmarkException {
public:
    DataFormatException(const std::string& functionName, const std::string& message)
        : BenchmarkException(nullptr, 0, functionName, "Data Format Error", message) {}
};

} // namespace ionbench

#define THROW_INVALID_PARAM(func, msg) throw ionbench::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define THROW_SIMULATION_ERROR(func, msg) throw ionbench::SimulationException(__FILE__, __LINE__, func, msg)
#define THROW_CONFIGURATION_ERROR(func, msg) throw ionbench::ConfigurationException(__FILE__, __LINE__, func, msg)
#define THROW_DOMAIN_ERROR(func, msg) throw ionbench::TransformDomainException(__FILE__, __LINE__, func, msg)
#define THROW_OUT_OF_RANGE(func, msg) throw ionbench::OutOfRangeException(__FILE__, __LINE__, func, msg)

#endif // EXCEPTIONS_HPP
