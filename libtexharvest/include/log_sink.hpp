/**
 * @file log_sink.hpp
 * @brief Severity levels and the abstract sink interface used by Logger.
 */

#ifndef TEXHARVEST_LOG_SINK_HPP
#define TEXHARVEST_LOG_SINK_HPP

#include <string_view>

namespace texharvest {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (stage transitions, temp dirs)
    Info,    ///< Normal operation (downloads, extracted file counts)
    Warning, ///< Recoverable problems (first compile pass failed, retrying)
    Error    ///< Failures that end an item's run
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, test capture).
 * The Logger facade fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component (e.g. "Downloader").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace texharvest

#endif // TEXHARVEST_LOG_SINK_HPP
