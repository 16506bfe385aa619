/**
 * @file errors.hpp
 * @brief Error taxonomy and the Outcome<T> result union used by every stage.
 *
 * Stages never throw for expected failures. They return an Outcome<T>,
 * which holds either the value or a PipelineError describing which stage
 * failed and why. The orchestrator inspects the variant directly.
 */

#ifndef TEXHARVEST_ERRORS_HPP
#define TEXHARVEST_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace texharvest {

/**
 * @brief Which part of the pipeline produced an error.
 */
enum class ErrorKind {
    Validation,  ///< Malformed identifier, rejected before any I/O
    Download,    ///< Network or HTTP failure
    Extraction,  ///< Oversized, corrupt or unsafe archive
    Processing,  ///< No resolvable main file
    Compilation, ///< Typesetter failure (see CompileFailureKind)
    Cancelled,   ///< Stop requested while the item was in flight
    Internal     ///< Unexpected exception at the item task boundary
};

/**
 * @brief Distinct reasons a compilation can fail.
 */
enum class CompileFailureKind {
    Timeout,         ///< A pass exceeded the per-pass timeout
    BinaryNotFound,  ///< The typesetter executable could not be started
    NonZeroExit,     ///< The second pass exited with a non-zero status
    ArtifactMissing, ///< Both passes ran but no rendered output was produced
    Cancelled,       ///< Stop requested while a pass was running
    WorkspaceError   ///< The temporary working directory could not be prepared
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;
[[nodiscard]] std::string_view to_string(CompileFailureKind kind) noexcept;

/**
 * @brief A typed stage error.
 */
struct PipelineError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;

    static PipelineError validation(std::string msg) { return {ErrorKind::Validation, std::move(msg)}; }
    static PipelineError download(std::string msg) { return {ErrorKind::Download, std::move(msg)}; }
    static PipelineError extraction(std::string msg) { return {ErrorKind::Extraction, std::move(msg)}; }
    static PipelineError processing(std::string msg) { return {ErrorKind::Processing, std::move(msg)}; }
    static PipelineError cancelled(std::string msg) { return {ErrorKind::Cancelled, std::move(msg)}; }
    static PipelineError internal(std::string msg) { return {ErrorKind::Internal, std::move(msg)}; }
};

/**
 * @brief Either a value of type T or the PipelineError that prevented it.
 */
template<class T>
using Outcome = std::variant<T, PipelineError>;

template<class T>
[[nodiscard]] bool is_ok(const Outcome<T>& o) noexcept {
    return std::holds_alternative<T>(o);
}

/**
 * @brief Thrown by PipelineConfig::validate() for unusable settings.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace texharvest

#endif // TEXHARVEST_ERRORS_HPP
