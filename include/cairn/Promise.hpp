//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_PROMISE_H_
#define _CAIRN_PROMISE_H_

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>
#include "Either.hpp"
#include "scheduler/SpinLock.hpp"

namespace cairn {

template <class T>
class Promise;

template <class T>
using PromiseRef = std::shared_ptr<Promise<T>>;

template <class T>
class Value;

template <class T>
using ValueRef = std::shared_ptr<Value<T>>;

/**
 * A `Promise` represents the "producer" side of an asynchronous result. A producer
 * completes the result exactly once by calling `set`, `fail` or `complete`, at which
 * point every consumer registered through the paired `Value` is notified - on the
 * thread that completed the promise.
 *
 * Completing a promise twice is a programming error and throws `std::runtime_error`
 * to the second caller. The first result is never replaced.
 */
template <class T>
class Promise final : public std::enable_shared_from_this<Promise<T>> {
public:
    /**
     * Create a new, unset promise.
     *
     * @return A reference to the created promise.
     */
    static PromiseRef<T> create();

    /**
     * Construct a promise. Provided purely for compatibility with `std::make_shared`.
     * Please use `Promise<T>::create` instead.
     */
    Promise();

    Promise(const Promise&) = delete;
    Promise& operator=(const Promise&) = delete;

    /**
     * Complete this promise with the given value.
     *
     * @param value The value to use when completing the promise.
     */
    void set(const T& value);
    void set(T&& value);

    /**
     * Complete this promise with the given error.
     *
     * @param error The error to use when completing the promise.
     */
    void fail(const Error& error);

    /**
     * Complete this promise with the given value OR error.
     *
     * @param result The value OR error to use when completing the promise.
     */
    void complete(Result<T> result);

    /**
     * Attempt to retrieve the result of this promise. Will return nothing
     * if the promise has not yet completed.
     *
     * @return The result of this promise or nothing.
     */
    std::optional<Result<T>> get() const;

    /**
     * Check if this promise has been completed.
     *
     * @return True iff `set`, `fail` or `complete` has been called.
     */
    bool isComplete() const;

    /**
     * Obtain the consumer side of this promise.
     *
     * @return A value which completes when this promise completes.
     */
    ValueRef<T> value();

    /**
     * Register a callback to run once this promise completes. The callback
     * runs immediately on the calling thread if the promise is already
     * complete.
     *
     * @param callback The callback to run with the result.
     */
    void onComplete(const std::function<void(const Result<T>&)>& callback);

private:
    std::optional<Result<T>> resultOpt;
    mutable scheduler::SpinLock lock;
    std::vector<std::function<void(const Result<T>&)>> callbacks;
};

template <class T>
PromiseRef<T> Promise<T>::create() {
    return std::make_shared<Promise<T>>();
}

template <class T>
Promise<T>::Promise()
    : resultOpt(std::nullopt)
    , lock()
    , callbacks()
{}

template <class T>
void Promise<T>::set(const T& value) {
    complete(Result<T>::left(value));
}

template <class T>
void Promise<T>::set(T&& value) {
    complete(Result<T>::left(std::move(value)));
}

template <class T>
void Promise<T>::fail(const Error& error) {
    complete(Result<T>::right(error));
}

template <class T>
void Promise<T>::complete(Result<T> result) {
    std::vector<std::function<void(const Result<T>&)>> callbacks_to_run;

    {
        std::lock_guard<scheduler::SpinLock> guard(lock);

        if(resultOpt.has_value()) {
            if(resultOpt->is_left()) {
                throw std::runtime_error("Promise already successfully completed.");
            } else {
                throw std::runtime_error("Promise already completed with an error.");
            }
        }

        resultOpt = std::move(result);
        std::swap(callbacks, callbacks_to_run);
    }

    // The result is immutable from here on so it can be read without the lock.
    for(auto& callback : callbacks_to_run) {
        callback(*resultOpt);
    }
}

template <class T>
std::optional<Result<T>> Promise<T>::get() const {
    std::lock_guard<scheduler::SpinLock> guard(lock);
    return resultOpt;
}

template <class T>
bool Promise<T>::isComplete() const {
    std::lock_guard<scheduler::SpinLock> guard(lock);
    return resultOpt.has_value();
}

template <class T>
void Promise<T>::onComplete(const std::function<void(const Result<T>&)>& callback) {
    bool runNow = false;

    {
        std::lock_guard<scheduler::SpinLock> guard(lock);
        if(resultOpt.has_value()) {
            runNow = true;
        } else {
            callbacks.push_back(callback);
        }
    }

    if(runNow) {
        callback(*resultOpt);
    }
}

} // namespace cairn

#include "Value.hpp"

#endif
