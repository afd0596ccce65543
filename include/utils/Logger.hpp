#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace ionbench {

/**
 * @enum LogLevel
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,    ///< Per-evaluation detail (cache hits, absorbed failures).
    INFO,     ///< Run progress and final reports.
    WARNING,  ///< Simulations that failed and were scored as +inf.
    ERROR,    ///< Errors hindering specific operations.
    FATAL     ///< Critical errors halting the program.
};

/**
 * @class Logger
 * @brief Process-wide logger shared by every benchmarker and optimiser.
 *
 * Lines look like `2024-01-31 12:00:00 [INFO]    [Benchmarker::evaluate] message`.
 * ERROR and FATAL go to stderr, everything else to stdout; when file logging is on,
 * every emitted line is also appended to the file.
 */
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level) { logLevel_.store(level); }
    LogLevel getLogLevel() const { return logLevel_.load(); }

    /**
     * @brief True if a message at @p level would be emitted.
     *
     * The evaluator calls this once per cost evaluation before building DEBUG strings.
     */
    bool isEnabled(LogLevel level) const { return level >= logLevel_.load(); }

    /**
     * @brief Parses "debug", "info", "warning", "error" or "fatal" (any case).
     */
    static std::optional<LogLevel> parseLevel(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "info") return LogLevel::INFO;
        if (name == "warning" || name == "warn") return LogLevel::WARNING;
        if (name == "error") return LogLevel::ERROR;
        if (name == "fatal") return LogLevel::FATAL;
        return std::nullopt;
    }

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:   return "DEBUG";
            case LogLevel::INFO:    return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR:   return "ERROR";
            case LogLevel::FATAL:   return "FATAL";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Starts or stops appending log lines to @p filename.
     *
     * @return false if the file could not be opened; console logging continues either way.
     */
    bool enableFileLogging(bool enable, const std::string& filename = "ionbench.log") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        if (!enable) {
            return true;
        }
        logFile_.open(filename, std::ios::app);
        if (!logFile_.is_open()) {
            std::cerr << format(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename) << std::endl;
            return false;
        }
        return true;
    }

    void log(LogLevel level, const std::string& source, const std::string& message) {
        if (!isEnabled(level)) return;

        const std::string line = format(level, source, message);
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
        out << line << '\n';
        if (level >= LogLevel::WARNING) {
            out.flush();
        }
        if (logFile_.is_open()) {
            logFile_ << line << std::endl;
        }
    }

    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    Logger() : logLevel_(LogLevel::INFO) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string format(LogLevel level, const std::string& source, const std::string& message) {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ' '
            << std::left << std::setw(10) << ("[" + std::string(levelName(level)) + "]")
            << '[' << source << "] " << message;
        return oss.str();
    }

    std::atomic<LogLevel> logLevel_;  ///< Messages below this level are dropped.
    std::ofstream logFile_;           ///< Open while file logging is enabled.
    std::mutex mutex_;                ///< Serialises console and file output.
};

} // namespace ionbench

#endif // LOGGER_HPP
