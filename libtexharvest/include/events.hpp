#ifndef TEXHARVEST_EVENTS_HPP
#define TEXHARVEST_EVENTS_HPP

#include "errors.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace texharvest {

/**
 * @brief Steps an item passes through, in order.
 */
enum class Stage {
    Validating,
    Downloading,
    Extracting,
    Resolving,
    ExtractingText,
    Compiling,
    ReadingArtifact,
    Done
};

[[nodiscard]] constexpr std::string_view to_string(const Stage stage) noexcept {
    switch (stage) {
        case Stage::Validating:      return "validating";
        case Stage::Downloading:     return "downloading";
        case Stage::Extracting:      return "extracting";
        case Stage::Resolving:       return "resolving";
        case Stage::ExtractingText:  return "extracting-text";
        case Stage::Compiling:       return "compiling";
        case Stage::ReadingArtifact: return "reading-artifact";
        case Stage::Done:            return "done";
    }
    return "unknown";
}

/**
 * @brief Item lifecycle events published on the EventBus.
 *
 * Plain data carriers; every item produces one ItemStartEvent followed by
 * exactly one ItemCompleteEvent or ItemErrorEvent.
 */

struct ItemStartEvent {
    std::string id;               ///< Identifier as requested
    bool include_rendered = false; ///< Whether compilation was requested
};

struct StageChangeEvent {
    std::string id;
    Stage stage = Stage::Validating;
};

/**
 * @brief Emitted when an item finishes successfully.
 */
struct ItemCompleteEvent {
    std::string id;
    std::string main_file;
    size_t file_count = 0;
    size_t text_length = 0;
    bool rendered = false;                 ///< True if a rendered artifact was produced
    std::string compilation_error;         ///< Recovered compile/read failure, if any
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when an item fails.
 */
struct ItemErrorEvent {
    std::string id;
    ErrorKind kind = ErrorKind::Internal;
    std::string error_message;
    std::chrono::milliseconds duration{0};
};

} // namespace texharvest

#endif // TEXHARVEST_EVENTS_HPP
