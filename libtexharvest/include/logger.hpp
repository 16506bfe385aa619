/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Every component of the pipeline logs through Logger::log(). The facade
 * delegates to one or more registered ILogSink implementations, so the
 * library itself never decides where output ends up.
 */

#ifndef TEXHARVEST_LOGGER_HPP
#define TEXHARVEST_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace texharvest {

/**
 * @brief Static logging facade for texharvest.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "texharvest").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "texharvest");

    /**
     * @brief Converts a LogLevel enum to its string representation.
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
     * @brief Parses a level name ("DEBUG", "INFO", "WARNING", "ERROR").
     * Case-insensitive.
     * @return The level, or std::nullopt for "NONE" and unknown names.
     */
    static std::optional<LogLevel> string_to_level(const std::string& level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace texharvest

#endif // TEXHARVEST_LOGGER_HPP
