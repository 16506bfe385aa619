#include "../../include/pipeline_config.hpp"
#include "../../include/errors.hpp"

namespace texharvest {

void PipelineConfig::validate() const {
    if (max_downloads < 1)
        throw ConfigError("max_downloads must be at least 1");
    if (max_extractions < 1)
        throw ConfigError("max_extractions must be at least 1");
    if (max_compilations < 1)
        throw ConfigError("max_compilations must be at least 1");
    if (burst_size < 1)
        throw ConfigError("burst_size must be at least 1");
    if (!(requests_per_second > 0.0))
        throw ConfigError("requests_per_second must be positive");
    if (download_timeout.count() < 1)
        throw ConfigError("download_timeout must be at least 1s");
    if (compilation_timeout.count() < 1)
        throw ConfigError("compilation_timeout must be at least 1s");
    if (max_files_per_archive < 1)
        throw ConfigError("max_files_per_archive must be at least 1");
    if (max_archive_size < 1024)
        throw ConfigError("max_archive_size must be at least 1 KiB");
    if (retry_backoff < 1.0)
        throw ConfigError("retry_backoff must be >= 1.0");
    if (retry_delay.count() < 0)
        throw ConfigError("retry_delay must not be negative");
    if (base_url.empty())
        throw ConfigError("base_url must not be empty");
    if (typesetter.empty())
        throw ConfigError("typesetter must not be empty");
}

unsigned PipelineConfig::effective_scheduler_threads() const noexcept {
    if (scheduler_threads > 0) return scheduler_threads;
    return max_downloads + max_extractions + max_compilations;
}

unsigned PipelineConfig::effective_worker_threads() const noexcept {
    if (worker_threads > 0) return worker_threads;
    return max_extractions + max_compilations;
}

} // namespace texharvest
