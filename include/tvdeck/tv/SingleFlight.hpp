#pragma once

#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <utility>

namespace tvdeck::tv {

/**
 * @brief Collapse concurrent calls for the same key into one execution.
 *
 * The first caller for a key runs the work; callers that arrive while it is
 * in flight block on a `std::shared_future` and receive a copy of the same
 * result. Once the leader finishes, the next call for that key starts a fresh
 * execution. Different keys never wait on each other.
 *
 * `Value` must be copyable.
 */
template <typename Key, typename Value>
class SingleFlight {
public:
    /**
     * @param work   Callable returning Value, run only by the leader.
     * @param shared Optional out-flag set true when this caller joined an
     *               execution started by someone else.
     */
    template <typename Work>
    Value run(const Key& key, Work&& work, bool* shared = nullptr) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (auto it = calls_.find(key); it != calls_.end()) {
            auto pending = it->second;
            lock.unlock();
            if (shared) *shared = true;
            return pending.get();
        }

        std::promise<Value> promise;
        calls_.emplace(key, promise.get_future().share());
        lock.unlock();
        if (shared) *shared = false;

        try {
            Value value = std::forward<Work>(work)();
            finish(key);
            promise.set_value(value);
            return value;
        } catch (...) {
            // Followers see the same exception; the leader rethrows it.
            finish(key);
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    bool inFlight(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.count(key) != 0;
    }

private:
    void finish(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.erase(key);
    }

    mutable std::mutex mutex_;
    std::map<Key, std::shared_future<Value>> calls_;
};

} // namespace tvdeck::tv
