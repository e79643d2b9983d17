/**
 * @file logger.hpp
 * @brief Provides the thread-safe logging facade owned by a run.
 *
 * A Logger delegates log messages to one or more registered ILogSink
 * implementations. There is no process-wide instance: the run context
 * owns one and hands it to the components that need it.
 */

#ifndef METAWIPE_LOGGER_HPP
#define METAWIPE_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace metawipe {

/**
 * @brief Logging facade for metawipe.
 *
 * Fans every message out to all registered sinks. All operations are
 * thread-safe.
 */
class Logger {
public:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    void add_sink(std::unique_ptr<ILogSink> sink);

    /// Remove all configured sinks.
    void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "metawipe").
     */
    void log(LogLevel level,
             std::string_view msg,
             std::string_view tag = "metawipe");

    void debug(const std::string_view msg, const std::string_view tag) { log(LogLevel::Debug, msg, tag); }
    void info(const std::string_view msg, const std::string_view tag) { log(LogLevel::Info, msg, tag); }
    void warning(const std::string_view msg, const std::string_view tag) { log(LogLevel::Warning, msg, tag); }
    void error(const std::string_view msg, const std::string_view tag) { log(LogLevel::Error, msg, tag); }

    /**
     * @brief Converts a LogLevel enum to its string representation.
     * @param level The enum value.
     * @return A constant string (e.g., "DEBUG", "INFO").
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     * Case-sensitive. Returns LogLevel::Error if not matched.
     * @param level The string value (e.g., "DEBUG", "INFO").
     * @return The corresponding LogLevel enum.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    ///< List of all registered sink implementations.
    std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    std::mutex mtx_;
};

} // namespace metawipe

#endif // METAWIPE_LOGGER_HPP
