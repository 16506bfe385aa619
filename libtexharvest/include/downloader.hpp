/**
 * @file downloader.hpp
 * @brief Rate-limited fetch of source archives.
 */

#ifndef TEXHARVEST_DOWNLOADER_HPP
#define TEXHARVEST_DOWNLOADER_HPP

#include "errors.hpp"
#include "file_set.hpp"
#include "http_transport.hpp"
#include "metrics.hpp"
#include "rate_limiter.hpp"
#include "stage_semaphore.hpp"
#include <chrono>
#include <stop_token>
#include <string>

namespace texharvest {

/**
 * @brief Fetches the source archive of one paper.
 *
 * @details Each fetch takes one of the downloader's own burst slots, then
 * waits on the RateLimiter, then performs a GET of `base_url + id`. There is
 * no retry here; retrying is the orchestrator's decision.
 *
 * Every fetch increments the `downloads` counter with a
 * `status=success|error` tag.
 */
class Downloader {
public:
    /**
     * @param transport HTTP implementation; must outlive the downloader.
     * @param limiter Shared request throttle; must outlive the downloader.
     * @param metrics Metrics sink; must outlive the downloader.
     * @param base_url Prefix the identifier is appended to.
     * @param burst_size Maximum concurrent fetches through this downloader.
     */
    Downloader(IHttpTransport& transport,
               RateLimiter& limiter,
               IMetricsSink& metrics,
               std::string base_url,
               unsigned burst_size);

    /**
     * @brief Download the archive for @p id.
     * @param timeout Bound on the network call only (not on slot or rate waits).
     * @return Archive bytes, or a Download / Cancelled error.
     */
    Outcome<Bytes> fetch(const std::string& id,
                         std::chrono::milliseconds timeout,
                         std::stop_token st = {});

    [[nodiscard]] std::string url_for(const std::string& id) const { return base_url_ + id; }

    [[nodiscard]] const StageSemaphore& burst() const noexcept { return burst_; }

private:
    IHttpTransport& transport_;
    RateLimiter& limiter_;
    IMetricsSink& metrics_;
    std::string base_url_;
    StageSemaphore burst_;
};

} // namespace texharvest

#endif // TEXHARVEST_DOWNLOADER_HPP
