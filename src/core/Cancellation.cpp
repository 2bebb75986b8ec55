#include "tvdeck/core/Cancellation.hpp"

#include <thread>

namespace tvdeck::core {

bool CancellationToken::isCancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        if (duration > std::chrono::milliseconds::zero()) std::this_thread::sleep_for(duration);
        return true;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    if (duration <= std::chrono::milliseconds::zero()) return !state_->cancelled;
    return !state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
}

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

} // namespace tvdeck::core
