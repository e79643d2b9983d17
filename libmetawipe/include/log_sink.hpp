#ifndef METAWIPE_LOG_SINK_HPP
#define METAWIPE_LOG_SINK_HPP

#include <string_view>

namespace metawipe {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks compare against these to decide whether a message is emitted.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (collaborator stderr, skipped steps)
    Info,    ///< General informational messages about normal operation
    Warning, ///< Recoverable problems (unreadable directory, failed timestamp reset)
    Error    ///< Per-file failures that need attention
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define where log messages are delivered
 * (console, file, test capture). The Logger fans out to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace metawipe

#endif // METAWIPE_LOG_SINK_HPP
