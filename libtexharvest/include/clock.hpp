/**
 * @file clock.hpp
 * @brief Injectable time source used by RateLimiter and retry back-off.
 */

#ifndef TEXHARVEST_CLOCK_HPP
#define TEXHARVEST_CLOCK_HPP

#include <chrono>
#include <stop_token>

namespace texharvest {

/**
 * @brief Time source with an interruptible sleep.
 */
struct IClock {
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    [[nodiscard]] virtual time_point now() const = 0;

    /**
     * @brief Suspend the caller for @p d.
     * @return false if @p st was signalled before the time elapsed.
     */
    virtual bool sleep_for(duration d, std::stop_token st) = 0;
};

/**
 * @brief IClock over std::chrono::steady_clock.
 */
class SteadyClock final : public IClock {
public:
    [[nodiscard]] time_point now() const override { return std::chrono::steady_clock::now(); }
    bool sleep_for(duration d, std::stop_token st) override;

    /// @return A process-wide instance.
    static SteadyClock& instance();
};

} // namespace texharvest

#endif // TEXHARVEST_CLOCK_HPP
