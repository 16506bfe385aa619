#include "../../include/clock.hpp"
#include <condition_variable>
#include <mutex>

namespace texharvest {

bool SteadyClock::sleep_for(const duration d, std::stop_token st) {
    if (d <= duration::zero()) return !st.stop_requested();
    std::mutex mtx;
    std::condition_variable_any cv;
    std::unique_lock lock(mtx);
    // nothing ever notifies cv: the wait ends on timeout or on stop
    cv.wait_for(lock, st, d, [] { return false; });
    return !st.stop_requested();
}

SteadyClock& SteadyClock::instance() {
    static SteadyClock clock;
    return clock;
}

} // namespace texharvest
