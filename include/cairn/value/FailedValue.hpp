//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_FAILED_VALUE_H_
#define _CAIRN_FAILED_VALUE_H_

#include <exception>
#include "../Value.hpp"

namespace cairn::value {

template <class T>
class FailedValue final : public Value<T> {
public:
    explicit FailedValue(Error error);

    void onComplete(const std::function<void(const Result<T>&)>& callback) override;
    void consume(const std::function<void(const T&)>& callback) override;
    void onFail(const std::function<void(const Error&)>& callback) override;
    std::optional<Result<T>> get() const override;
    T await() override;

private:
    const Error error;
};

template <class T>
FailedValue<T>::FailedValue(Error error)
    : error(std::move(error))
{}

template <class T>
void FailedValue<T>::onComplete(const std::function<void(const Result<T>&)>& callback) {
    callback(Result<T>::right(error));
}

template <class T>
void FailedValue<T>::consume(const std::function<void(const T&)>&) {
    return;
}

template <class T>
void FailedValue<T>::onFail(const std::function<void(const Error&)>& callback) {
    callback(error);
}

template <class T>
std::optional<Result<T>> FailedValue<T>::get() const {
    return Result<T>::right(error);
}

template <class T>
T FailedValue<T>::await() {
    std::rethrow_exception(error);
}

} // namespace cairn::value

#endif
