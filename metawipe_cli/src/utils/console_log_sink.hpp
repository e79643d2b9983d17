#ifndef METAWIPE_CONSOLE_LOG_SINK_HPP
#define METAWIPE_CONSOLE_LOG_SINK_HPP

#include "../../../libmetawipe/include/log_sink.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints log lines at or above a threshold to stderr.
 *
 * Lines start on a fresh row so they don't collide with the progress line.
 */
class ConsoleLogSink final : public metawipe::ILogSink {
public:
    metawipe::LogLevel log_level = metawipe::LogLevel::Warning;

    void log(const metawipe::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case metawipe::LogLevel::Debug:
                std::cerr << "\n[DEBUG][" << tag << "] " << message << std::flush;
                break;
            case metawipe::LogLevel::Info:
                std::cerr << "\n[INFO ][" << tag << "] " << message << std::flush;
                break;
            case metawipe::LogLevel::Warning:
                std::cerr << "\n[WARN ][" << tag << "] " << message << std::flush;
                break;
            case metawipe::LogLevel::Error:
                std::cerr << "\n[ERROR][" << tag << "] " << message << std::flush;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // METAWIPE_CONSOLE_LOG_SINK_HPP
