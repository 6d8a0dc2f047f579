#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace voicetype {

// Value holder that notifies subscribers when the value changes.
// Listeners run on the thread that called set(), outside the lock.
template <typename T>
class Observable {
public:
    using Listener = std::function<void(const T&)>;
    using SubscriptionId = int;

    Observable() = default;
    explicit Observable(T initial) : value_(std::move(initial)) {}

    Observable(const Observable&) = delete;
    Observable& operator=(const Observable&) = delete;

    T get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    // Returns true if the value changed and listeners were notified
    bool set(const T& value) {
        std::vector<Listener> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (value_ == value) return false;
            value_ = value;
            listeners.reserve(listeners_.size());
            for (const auto& entry : listeners_) {
                listeners.push_back(entry.second);
            }
        }
        for (const auto& listener : listeners) {
            listener(value);
        }
        return true;
    }

    SubscriptionId subscribe(Listener listener) const {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = next_id_++;
        listeners_[id] = std::move(listener);
        return id;
    }

    void unsubscribe(SubscriptionId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.erase(id);
    }

private:
    mutable std::mutex mutex_;
    T value_{};
    mutable std::map<SubscriptionId, Listener> listeners_;
    mutable SubscriptionId next_id_ = 1;
};

} // namespace voicetype
