/**
 * @file http_transport.hpp
 * @brief Minimal HTTP GET abstraction and its libcurl implementation.
 */

#ifndef TEXHARVEST_HTTP_TRANSPORT_HPP
#define TEXHARVEST_HTTP_TRANSPORT_HPP

#include "errors.hpp"
#include "file_set.hpp"
#include <chrono>
#include <cstddef>
#include <stop_token>
#include <string>

namespace texharvest {

/**
 * @brief Status and body of a completed HTTP exchange.
 */
struct HttpResponse {
    long status = 0;
    Bytes body;
};

/**
 * @brief Performs a single GET request.
 *
 * @details Implementations return a PipelineError only when no HTTP
 * response was obtained at all: kind Download for connection failure,
 * timeout or oversized body, kind Cancelled when @p st was signalled.
 * A response with any status code is a successful exchange; judging the
 * status is the caller's job.
 */
struct IHttpTransport {
    virtual ~IHttpTransport() = default;

    virtual Outcome<HttpResponse> get(const std::string& url,
                                      std::chrono::milliseconds timeout,
                                      std::stop_token st) = 0;
};

/**
 * @brief IHttpTransport backed by libcurl's easy interface.
 *
 * One easy handle is created per request, so a single instance can be used
 * from many threads at once.
 */
class CurlTransport final : public IHttpTransport {
public:
    /**
     * @param user_agent Value of the User-Agent header.
     * @param max_body_bytes Bodies larger than this abort the transfer.
     */
    CurlTransport(std::string user_agent, size_t max_body_bytes);

    Outcome<HttpResponse> get(const std::string& url,
                              std::chrono::milliseconds timeout,
                              std::stop_token st) override;

private:
    std::string user_agent_;
    size_t max_body_bytes_;
};

} // namespace texharvest

#endif // TEXHARVEST_HTTP_TRANSPORT_HPP
