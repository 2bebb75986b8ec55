#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace tvdeck::core {

namespace detail {
struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};
} // namespace detail

/**
 * @brief Read side of a cooperative cancellation flag.
 *
 * A default-constructed token is never cancelled. Tokens are cheap to copy;
 * all copies observe the same flag as the source that issued them.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const;

    /**
     * @brief Sleep for @p duration, waking as soon as the source is cancelled.
     * @return false if cancelled before or during the sleep.
     */
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/// Write side: owned by whoever may abandon the operation (e.g. a client session).
class CancellationSource {
public:
    CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

    /// Idempotent; wakes every token currently in sleepFor().
    void cancel();
    bool isCancelled() const { return token().isCancelled(); }
    CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace tvdeck::core
