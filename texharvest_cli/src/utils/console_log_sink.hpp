#ifndef TEXHARVEST_CONSOLE_LOG_SINK_HPP
#define TEXHARVEST_CONSOLE_LOG_SINK_HPP

#include "../../../libtexharvest/include/log_sink.hpp"
#include <iostream>
#include <optional>

/**
 * @brief Writes messages at or above log_level to stderr.
 *
 * stdout is left to the result output (--json). An empty log_level
 * silences the sink.
 */
class ConsoleLogSink final : public texharvest::ILogSink {
public:
    std::optional<texharvest::LogLevel> log_level = texharvest::LogLevel::Warning;

    void log(const texharvest::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!log_level || level < *log_level) return;
        switch (level) {
            case texharvest::LogLevel::Debug:
                std::cerr << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case texharvest::LogLevel::Info:
                std::cerr << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case texharvest::LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case texharvest::LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // TEXHARVEST_CONSOLE_LOG_SINK_HPP
