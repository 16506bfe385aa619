/**
 * @file rate_limiter.hpp
 * @brief Sliding-window request throttle.
 */

#ifndef TEXHARVEST_RATE_LIMITER_HPP
#define TEXHARVEST_RATE_LIMITER_HPP

#include "clock.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <stop_token>

namespace texharvest {

/**
 * @brief Keeps the request rate within a trailing one-second window.
 *
 * @details acquire() suspends the caller until one more request would not
 * push the number of requests issued in the last second above
 * requests_per_second, then records the request. The check-and-record is
 * a single critical section; waiting happens outside the lock and the check
 * is repeated after every wake-up, so concurrent callers never overshoot.
 *
 * A fractional rate is rounded down (2.5 allows 2 per second). Rates below
 * one widen the window instead: 0.5 allows one request per two seconds.
 */
class RateLimiter {
public:
    /**
     * @param requests_per_second Requests allowed in any one-second window.
     * @param clock Time source; must outlive the limiter.
     */
    explicit RateLimiter(double requests_per_second, IClock& clock = SteadyClock::instance());

    /**
     * @brief Wait for permission to issue one request.
     * @return false if @p st was signalled while waiting (nothing recorded).
     */
    bool acquire(std::stop_token st = {});

    /// @return Requests recorded within the trailing window.
    [[nodiscard]] size_t recent_requests() const;

    [[nodiscard]] double requests_per_second() const noexcept { return rps_; }

private:
    void prune(IClock::time_point now);

    const double rps_;
    size_t capacity_ = 1;            ///< Requests allowed per window
    IClock::duration window_{};
    IClock& clock_;
    mutable std::mutex mtx_;
    std::deque<IClock::time_point> history_;
};

} // namespace texharvest

#endif // TEXHARVEST_RATE_LIMITER_HPP
