#include "../../include/errors.hpp"

namespace texharvest {

std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation:  return "ValidationError";
        case ErrorKind::Download:    return "DownloadError";
        case ErrorKind::Extraction:  return "ExtractionError";
        case ErrorKind::Processing:  return "ProcessingError";
        case ErrorKind::Compilation: return "CompilationError";
        case ErrorKind::Cancelled:   return "Cancelled";
        case ErrorKind::Internal:    return "InternalError";
    }
    return "UnknownError";
}

std::string_view to_string(const CompileFailureKind kind) noexcept {
    switch (kind) {
        case CompileFailureKind::Timeout:         return "Timeout";
        case CompileFailureKind::BinaryNotFound:  return "BinaryNotFound";
        case CompileFailureKind::NonZeroExit:     return "NonZeroExit";
        case CompileFailureKind::ArtifactMissing: return "ArtifactMissing";
        case CompileFailureKind::Cancelled:       return "Cancelled";
        case CompileFailureKind::WorkspaceError:  return "WorkspaceError";
    }
    return "Unknown";
}

} // namespace texharvest
