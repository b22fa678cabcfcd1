//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_PROMISE_VALUE_H_
#define _CAIRN_PROMISE_VALUE_H_

#include <condition_variable>
#include <exception>
#include <mutex>
#include "../Value.hpp"

namespace cairn::value {

/**
 * The value paired with a `Promise`. Any number of `PromiseValue`
 * instances may observe the same promise.
 */
template <class T>
class PromiseValue final : public Value<T> {
public:
    explicit PromiseValue(PromiseRef<T> promise);

    void onComplete(const std::function<void(const Result<T>&)>& callback) override;
    void consume(const std::function<void(const T&)>& callback) override;
    void onFail(const std::function<void(const Error&)>& callback) override;
    std::optional<Result<T>> get() const override;
    T await() override;

private:
    PromiseRef<T> promise;
};

template <class T>
PromiseValue<T>::PromiseValue(PromiseRef<T> promise)
    : promise(std::move(promise))
{}

template <class T>
void PromiseValue<T>::onComplete(const std::function<void(const Result<T>&)>& callback) {
    promise->onComplete(callback);
}

template <class T>
void PromiseValue<T>::consume(const std::function<void(const T&)>& callback) {
    promise->onComplete([callback](const Result<T>& result) {
        if(result.is_left()) {
            callback(result.get_left());
        }
    });
}

template <class T>
void PromiseValue<T>::onFail(const std::function<void(const Error&)>& callback) {
    promise->onComplete([callback](const Result<T>& result) {
        if(result.is_right()) {
            callback(result.get_right());
        }
    });
}

template <class T>
std::optional<Result<T>> PromiseValue<T>::get() const {
    return promise->get();
}

template <class T>
T PromiseValue<T>::await() {
    std::optional<Result<T>> result = promise->get();

    if(!result.has_value()) {
        auto mutex = std::make_shared<std::mutex>();
        auto completed = std::make_shared<std::condition_variable>();
        auto shared_result = std::make_shared<std::optional<Result<T>>>();

        promise->onComplete([mutex, completed, shared_result](const Result<T>& newResult) {
            {
                std::lock_guard<std::mutex> guard(*mutex);
                *shared_result = newResult;
            }
            completed->notify_all();
        });

        std::unique_lock<std::mutex> lock(*mutex);
        completed->wait(lock, [shared_result] { return shared_result->has_value(); });
        result = *shared_result;
    }

    if(result->is_left()) {
        return result->get_left();
    } else {
        std::rethrow_exception(result->get_right());
    }
}

} // namespace cairn::value

#endif
