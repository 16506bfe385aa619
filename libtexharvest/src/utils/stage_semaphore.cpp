#include "../../include/stage_semaphore.hpp"
#include "../../include/errors.hpp"

#include <algorithm>

namespace texharvest {

StageSemaphore::StageSemaphore(std::string name, const unsigned capacity)
    : name_(std::move(name)), capacity_(capacity) {
    if (capacity_ == 0) {
        throw ConfigError("stage '" + name_ + "' needs a capacity of at least 1");
    }
}

bool StageSemaphore::acquire(std::stop_token st) {
    std::unique_lock lock(mtx_);
    if (!cv_.wait(lock, st, [this] { return in_use_ < capacity_; })) {
        return false;
    }
    ++in_use_;
    peak_ = std::max(peak_, in_use_);
    return true;
}

void StageSemaphore::release() {
    {
        std::lock_guard lock(mtx_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_one();
}

unsigned StageSemaphore::in_use() const {
    std::lock_guard lock(mtx_);
    return in_use_;
}

unsigned StageSemaphore::available() const {
    std::lock_guard lock(mtx_);
    return capacity_ - in_use_;
}

unsigned StageSemaphore::peak() const {
    std::lock_guard lock(mtx_);
    return peak_;
}

} // namespace texharvest
