/**
 * @file BLEStateContainer.h
 * @brief Latest-value holder with synchronous subscribers
 *
 * A StateContainer owns the current value of one piece of state and a list
 * of listeners. Every mutation replaces the value and re-publishes a copy of
 * it to each listener, in subscription order. Subscribing delivers the
 * current value immediately.
 *
 * The value and listener list are guarded by the container's own mutex so
 * that value() on any thread returns a complete snapshot. Listeners run
 * outside that mutex but inside a recursive delivery mutex held from the
 * copy of the value to the last listener call. A subscriber registering on
 * one thread while another thread publishes therefore sees the values in
 * mutation order, and a listener may still publish or subscribe again.
 */
#pragma once

#include <functional>
#include <mutex>
#include <utility>
#include <vector>
#include <cstdint>

namespace CentralStack { namespace BLE {

/**
 * @brief Read-only view of an observable value
 */
template <typename T>
class IObservable {
public:
    using Listener = std::function<void(const T& value)>;
    using Token = uint32_t;

    static constexpr Token INVALID_TOKEN = 0;

    virtual ~IObservable() = default;

    /**
     * @brief Copy of the latest value
     */
    virtual T value() const = 0;

    /**
     * @brief Register a listener; it is called at once with the current value
     * @return Token for unsubscribe()
     */
    virtual Token subscribe(Listener listener) = 0;

    /**
     * @brief Remove a listener; unknown tokens are ignored
     */
    virtual void unsubscribe(Token token) = 0;
};

template <typename T>
class StateContainer : public IObservable<T> {
public:
    using typename IObservable<T>::Listener;
    using typename IObservable<T>::Token;

    explicit StateContainer(T initial = T()) : _value(std::move(initial)) {}

    StateContainer(const StateContainer&) = delete;
    StateContainer& operator=(const StateContainer&) = delete;

    T value() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _value;
    }

    Token subscribe(Listener listener) override {
        if (!listener) {
            return IObservable<T>::INVALID_TOKEN;
        }
        std::lock_guard<std::recursive_mutex> delivery(_delivery_mutex);
        Token token;
        T current;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            token = ++_next_token;
            _listeners.push_back(Entry{token, listener});
            current = _value;
        }
        listener(current);
        return token;
    }

    void unsubscribe(Token token) override {
        std::lock_guard<std::mutex> lock(_mutex);
        for (auto it = _listeners.begin(); it != _listeners.end(); ++it) {
            if (it->token == token) {
                _listeners.erase(it);
                return;
            }
        }
    }

    /**
     * @brief Replace the value and publish it
     */
    void set(T value) {
        update([&value](T& current) {
            current = std::move(value);
            return true;
        });
    }

    /**
     * @brief Mutate the value in place under the container lock
     *
     * @param mutation Returns true to publish the new value, false to leave
     *                 it unpublished (the value must then be unchanged)
     * @return Whatever the mutation returned
     */
    bool update(const std::function<bool(T&)>& mutation) {
        std::lock_guard<std::recursive_mutex> delivery(_delivery_mutex);
        T snapshot;
        std::vector<Entry> listeners;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!mutation(_value)) {
                return false;
            }
            snapshot = _value;
            listeners = _listeners;
        }
        for (const Entry& entry : listeners) {
            entry.listener(snapshot);
        }
        return true;
    }

    /**
     * @brief Publish the current value again without changing it
     */
    void republish() {
        update([](T&) { return true; });
    }

    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _listeners.size();
    }

private:
    struct Entry {
        Token token;
        Listener listener;
    };

    mutable std::mutex _mutex;
    std::recursive_mutex _delivery_mutex;
    T _value;
    std::vector<Entry> _listeners;
    Token _next_token = IObservable<T>::INVALID_TOKEN;
};

}} // namespace CentralStack::BLE
