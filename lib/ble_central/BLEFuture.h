/**
 * @file BLEFuture.h
 * @brief Single-shot and streaming result channels
 *
 * Promise/Future: completes exactly once, with a value or an Error.
 * Listeners added after completion are called immediately.
 *
 * StreamPromise/FutureStream: completes any number of times. Each stream
 * keeps a bounded history of completions (capacity 0 = unbounded) which is
 * replayed to listeners added later.
 *
 * Producer and consumer handles share state, so a handle stays valid after
 * the producer drops its promise. A producer starts a new session by
 * replacing its promise; listeners on the old one see no further results.
 */
#pragma once

#include "BLETypes.h"

#include <deque>
#include <functional>
#include <memory>
#include <vector>

namespace Tether { namespace BLE {

template <typename T>
class Future {
public:
    using SuccessCallback = std::function<void(const T& value)>;
    using FailureCallback = std::function<void(const Error& error)>;

    struct State {
        bool completed = false;
        bool succeeded = false;
        T value = T();
        Error error;
        std::vector<SuccessCallback> on_success;
        std::vector<FailureCallback> on_failure;
    };

    Future() : _state(std::make_shared<State>()) {}
    explicit Future(std::shared_ptr<State> state) : _state(state) {}

    Future& onSuccess(SuccessCallback callback) {
        if (_state->completed) {
            if (_state->succeeded) {
                callback(_state->value);
            }
        } else {
            _state->on_success.push_back(callback);
        }
        return *this;
    }

    Future& onFailure(FailureCallback callback) {
        if (_state->completed) {
            if (!_state->succeeded) {
                callback(_state->error);
            }
        } else {
            _state->on_failure.push_back(callback);
        }
        return *this;
    }

    bool completed() const { return _state->completed; }
    bool succeeded() const { return _state->completed && _state->succeeded; }
    bool failed() const { return _state->completed && !_state->succeeded; }

    /**
     * @brief Value if succeeded, otherwise a default-constructed T
     */
    const T& value() const { return _state->value; }

    /**
     * @brief Error if failed, otherwise an Error with code NONE
     */
    const Error& error() const { return _state->error; }

private:
    std::shared_ptr<State> _state;
};

template <typename T>
class Promise {
public:
    Promise() : _state(std::make_shared<typename Future<T>::State>()) {}

    Future<T> future() const { return Future<T>(_state); }

    bool completed() const { return _state->completed; }

    /**
     * @brief Complete with a value
     * @return false if the promise was already completed
     */
    bool success(const T& value) {
        if (_state->completed) {
            return false;
        }
        _state->completed = true;
        _state->succeeded = true;
        _state->value = value;
        // Listeners may add listeners; move them out before calling
        std::vector<typename Future<T>::SuccessCallback> callbacks;
        callbacks.swap(_state->on_success);
        _state->on_failure.clear();
        for (auto& callback : callbacks) {
            callback(value);
        }
        return true;
    }

    /**
     * @brief Complete with an error
     * @return false if the promise was already completed
     */
    bool failure(const Error& error) {
        if (_state->completed) {
            return false;
        }
        _state->completed = true;
        _state->succeeded = false;
        _state->error = error;
        std::vector<typename Future<T>::FailureCallback> callbacks;
        callbacks.swap(_state->on_failure);
        _state->on_success.clear();
        for (auto& callback : callbacks) {
            callback(error);
        }
        return true;
    }

private:
    std::shared_ptr<typename Future<T>::State> _state;
};

template <typename T>
class FutureStream {
public:
    using SuccessCallback = std::function<void(const T& value)>;
    using FailureCallback = std::function<void(const Error& error)>;

    struct Completion {
        bool succeeded = false;
        T value = T();
        Error error;
    };

    struct State {
        size_t capacity = 0;
        std::deque<Completion> history;
        std::vector<SuccessCallback> on_success;
        std::vector<FailureCallback> on_failure;
    };

    FutureStream() : _state(std::make_shared<State>()) {}
    explicit FutureStream(std::shared_ptr<State> state) : _state(state) {}

    /**
     * @brief Add a success listener, replaying retained successes first
     */
    FutureStream& onSuccess(SuccessCallback callback) {
        std::deque<Completion> replay = _state->history;
        _state->on_success.push_back(callback);
        for (const auto& completion : replay) {
            if (completion.succeeded) {
                callback(completion.value);
            }
        }
        return *this;
    }

    /**
     * @brief Add a failure listener, replaying retained failures first
     */
    FutureStream& onFailure(FailureCallback callback) {
        std::deque<Completion> replay = _state->history;
        _state->on_failure.push_back(callback);
        for (const auto& completion : replay) {
            if (!completion.succeeded) {
                callback(completion.error);
            }
        }
        return *this;
    }

    size_t count() const { return _state->history.size(); }

    /**
     * @brief Retained completions, oldest first
     */
    const std::deque<Completion>& history() const { return _state->history; }

    /**
     * @brief True when both handles refer to the same stream
     */
    bool sameStream(const FutureStream& other) const { return _state == other._state; }

private:
    std::shared_ptr<State> _state;
};

template <typename T>
class StreamPromise {
public:
    explicit StreamPromise(size_t capacity = 0) : _state(std::make_shared<typename FutureStream<T>::State>()) {
        _state->capacity = capacity;
    }

    FutureStream<T> stream() const { return FutureStream<T>(_state); }

    void success(const T& value) {
        typename FutureStream<T>::Completion completion;
        completion.succeeded = true;
        completion.value = value;
        retain(completion);
        std::vector<typename FutureStream<T>::SuccessCallback> callbacks = _state->on_success;
        for (auto& callback : callbacks) {
            callback(value);
        }
    }

    void failure(const Error& error) {
        typename FutureStream<T>::Completion completion;
        completion.succeeded = false;
        completion.error = error;
        retain(completion);
        std::vector<typename FutureStream<T>::FailureCallback> callbacks = _state->on_failure;
        for (auto& callback : callbacks) {
            callback(error);
        }
    }

private:
    void retain(const typename FutureStream<T>::Completion& completion) {
        _state->history.push_back(completion);
        if (_state->capacity > 0) {
            while (_state->history.size() > _state->capacity) {
                _state->history.pop_front();
            }
        }
    }

    std::shared_ptr<typename FutureStream<T>::State> _state;
};

}} // namespace Tether::BLE
