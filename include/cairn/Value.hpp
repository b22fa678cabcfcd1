//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_VALUE_H_
#define _CAIRN_VALUE_H_

#include <functional>
#include <memory>
#include <optional>

#include "Promise.hpp"

namespace cairn {

/**
 * A `Value` represents the "consumer" side of an asynchronous result. Consumers
 * are notified of the result either asynchronously (via `consume`, `onFail` or
 * `onComplete`) or, at the edge of an application, synchronously by blocking
 * with `await`.
 *
 * A value reaches exactly one terminal state: completed with a `T` or failed
 * with an `Error`. Every registered callback for that state fires exactly once -
 * on whichever thread produced the result, or immediately on the registering
 * thread if the value is already terminal. There is no ordering guarantee
 * across different values.
 */
template <class T>
class Value : public std::enable_shared_from_this<Value<T>> {
public:
    /**
     * Create a value wrapping an already computed result.
     *
     * @param result The result of this completed value.
     * @return A completed value.
     */
    static ValueRef<T> pure(T result);

    /**
     * Create a value which has already failed with the given error.
     *
     * @param error The failure of this value.
     * @return A failed value.
     */
    static ValueRef<T> failed(const Error& error);

    /**
     * Create a value whose completion is governed by the supplied promise.
     *
     * @param promise The promise which, when complete, also completes this value.
     * @return A value for the given promise.
     */
    static ValueRef<T> forPromise(PromiseRef<T> promise);

    /**
     * Register a callback to be evaluated when the result is
     * available - on success OR failure.
     *
     * @param callback The callback to execute.
     */
    virtual void onComplete(const std::function<void(const Result<T>&)>& callback) = 0;

    /**
     * Register a callback to be evaluated if the value completes
     * successfully.
     *
     * @param callback The callback to execute.
     */
    virtual void consume(const std::function<void(const T&)>& callback) = 0;

    /**
     * Register a callback to be evaluated if the value fails.
     *
     * @param callback The callback to execute.
     */
    virtual void onFail(const std::function<void(const Error&)>& callback) = 0;

    /**
     * Attempt to retrieve the result without blocking.
     *
     * @return The result or nothing if the value is still pending.
     */
    virtual std::optional<Result<T>> get() const = 0;

    /**
     * Block the current thread until the result is available. If the
     * value failed the error is rethrown.
     *
     * Never call this from a scheduler thread that is needed to produce
     * the result.
     *
     * @return The successful result.
     */
    virtual T await() = 0;

    /**
     * Create a new value by transforming the successful result of this
     * one. An exception thrown by the transform fails the new value.
     *
     * @param transform The function to apply to the result.
     * @return A value holding the transformed result.
     */
    template <class U, class Fn>
    ValueRef<U> map(Fn&& transform);

    virtual ~Value() = default;
};

/**
 * Wire both terminal events of `value` into `promise`. This is the only
 * mechanism used to move a result across an evaluation context boundary.
 *
 * @param value The upstream value.
 * @param promise The downstream promise to complete.
 */
template <class T>
void chain(const ValueRef<T>& value, const PromiseRef<T>& promise) {
    value->onComplete([promise](const Result<T>& result) {
        promise->complete(result);
    });
}

} // namespace cairn

#include "value/FailedValue.hpp"
#include "value/PromiseValue.hpp"
#include "value/PureValue.hpp"

namespace cairn {

template <class T>
ValueRef<T> Value<T>::pure(T result) {
    return std::make_shared<value::PureValue<T>>(std::move(result));
}

template <class T>
ValueRef<T> Value<T>::failed(const Error& error) {
    return std::make_shared<value::FailedValue<T>>(error);
}

template <class T>
ValueRef<T> Value<T>::forPromise(PromiseRef<T> promise) {
    return std::make_shared<value::PromiseValue<T>>(std::move(promise));
}

template <class T>
template <class U, class Fn>
ValueRef<U> Value<T>::map(Fn&& transform) {
    auto promise = Promise<U>::create();

    onComplete([promise, transform = std::forward<Fn>(transform)](const Result<T>& result) {
        if(result.is_right()) {
            promise->fail(result.get_right());
            return;
        }

        std::optional<U> mapped;
        try {
            mapped.emplace(transform(result.get_left()));
        } catch(...) {
            promise->fail(std::current_exception());
            return;
        }

        promise->set(std::move(*mapped));
    });

    return promise->value();
}

template <class T>
ValueRef<T> Promise<T>::value() {
    return Value<T>::forPromise(this->shared_from_this());
}

} // namespace cairn

#endif
