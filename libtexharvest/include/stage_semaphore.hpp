/**
 * @file stage_semaphore.hpp
 * @brief Counting semaphore with a runtime capacity and scoped slots.
 */

#ifndef TEXHARVEST_STAGE_SEMAPHORE_HPP
#define TEXHARVEST_STAGE_SEMAPHORE_HPP

#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>

namespace texharvest {

/**
 * @brief Bounds the number of in-flight operations of one stage.
 *
 * @details Unlike std::counting_semaphore the capacity is chosen at run
 * time, waits can be interrupted through a std::stop_token and the current
 * usage is observable (for status reporting and tests).
 */
class StageSemaphore {
public:
    StageSemaphore(std::string name, unsigned capacity);

    StageSemaphore(const StageSemaphore&) = delete;
    StageSemaphore& operator=(const StageSemaphore&) = delete;

    /**
     * @brief Take one slot, waiting while none is free.
     * @return false if @p st was signalled before a slot became free.
     */
    bool acquire(std::stop_token st = {});

    /**
     * @brief Return one slot.
     */
    void release();

    [[nodiscard]] unsigned capacity() const noexcept { return capacity_; }
    [[nodiscard]] unsigned in_use() const;
    [[nodiscard]] unsigned available() const;
    /// @return Highest number of slots ever held at once.
    [[nodiscard]] unsigned peak() const;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    const unsigned capacity_;
    unsigned in_use_{0};
    unsigned peak_{0};
    mutable std::mutex mtx_;
    std::condition_variable_any cv_;
};

/**
 * @brief Holds one slot of a StageSemaphore for the lifetime of the guard.
 *
 * Whatever path leaves the scope (return, exception, cancellation), the slot
 * is released exactly once.
 */
class SlotGuard {
public:
    SlotGuard(StageSemaphore& sem, std::stop_token st)
        : sem_(sem), acquired_(sem.acquire(std::move(st))) {}

    ~SlotGuard() {
        if (acquired_) sem_.release();
    }

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

    /// @return false if the wait was cancelled and no slot is held.
    [[nodiscard]] bool acquired() const noexcept { return acquired_; }

private:
    StageSemaphore& sem_;
    bool acquired_;
};

} // namespace texharvest

#endif // TEXHARVEST_STAGE_SEMAPHORE_HPP
