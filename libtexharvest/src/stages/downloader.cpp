#include "../../include/downloader.hpp"
#include "../../include/logger.hpp"

namespace texharvest {

namespace {
constexpr const char* kTag = "Downloader";
}

Downloader::Downloader(IHttpTransport& transport,
                       RateLimiter& limiter,
                       IMetricsSink& metrics,
                       std::string base_url,
                       const unsigned burst_size)
    : transport_(transport),
      limiter_(limiter),
      metrics_(metrics),
      base_url_(std::move(base_url)),
      burst_("burst", burst_size) {}

Outcome<Bytes> Downloader::fetch(const std::string& id,
                                 const std::chrono::milliseconds timeout,
                                 std::stop_token st) {
    SlotGuard slot(burst_, st);
    if (!slot.acquired() || !limiter_.acquire(st)) {
        return PipelineError::cancelled("download of " + id + " cancelled");
    }

    const std::string url = url_for(id);
    Logger::log(LogLevel::Info, "Downloading " + id + " from " + url, kTag);

    auto outcome = transport_.get(url, timeout, st);
    if (auto* err = std::get_if<PipelineError>(&outcome)) {
        metrics_.increment("downloads", {{"status", "error"}});
        Logger::log(LogLevel::Error, "Error downloading " + id + ": " + err->message, kTag);
        if (err->kind == ErrorKind::Cancelled) {
            return std::move(*err);
        }
        return PipelineError::download("Download failed for " + id + ": " + err->message);
    }

    auto& response = std::get<HttpResponse>(outcome);
    if (response.status < 200 || response.status >= 300) {
        metrics_.increment("downloads", {{"status", "error"}});
        Logger::log(LogLevel::Error,
                    "Failed to download " + id + ": HTTP " + std::to_string(response.status), kTag);
        return PipelineError::download("Failed to download " + id + ": HTTP " + std::to_string(response.status));
    }

    metrics_.increment("downloads", {{"status", "success"}});
    Logger::log(LogLevel::Info,
                "Downloaded " + id + ", size: " + std::to_string(response.body.size()) + " bytes", kTag);
    return std::move(response.body);
}

} // namespace texharvest
