#include "../../include/rate_limiter.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cmath>
#include <string>

namespace texharvest {

RateLimiter::RateLimiter(const double requests_per_second, IClock& clock)
    : rps_(requests_per_second), clock_(clock) {
    if (!(rps_ > 0.0)) {
        throw ConfigError("requests_per_second must be positive");
    }
    if (rps_ >= 1.0) {
        capacity_ = static_cast<size_t>(std::floor(rps_));
        window_ = std::chrono::seconds(1);
    } else {
        capacity_ = 1;
        window_ = std::chrono::duration_cast<IClock::duration>(std::chrono::duration<double>(1.0 / rps_));
    }
}

void RateLimiter::prune(const IClock::time_point now) {
    const auto cutoff = now - window_;
    while (!history_.empty() && history_.front() <= cutoff) {
        history_.pop_front();
    }
}

bool RateLimiter::acquire(std::stop_token st) {
    for (;;) {
        IClock::duration wait{};
        {
            std::lock_guard lock(mtx_);
            const auto now = clock_.now();
            prune(now);
            if (history_.size() < capacity_) {
                history_.push_back(now);
                return true;
            }
            wait = history_.front() + window_ - now;
        }
        Logger::log(LogLevel::Debug,
                    "Throttling for " +
                    std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(wait).count()) + "ms",
                    "RateLimiter");
        if (!clock_.sleep_for(wait, st)) {
            return false;
        }
    }
}

size_t RateLimiter::recent_requests() const {
    std::lock_guard lock(mtx_);
    const auto cutoff = clock_.now() - window_;
    size_t n = 0;
    for (const auto& t : history_) {
        if (t > cutoff) ++n;
    }
    return n;
}

} // namespace texharvest
