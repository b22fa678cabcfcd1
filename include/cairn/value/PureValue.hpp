//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_PURE_VALUE_H_
#define _CAIRN_PURE_VALUE_H_

#include "../Value.hpp"

namespace cairn::value {

template <class T>
class PureValue final : public Value<T> {
public:
    explicit PureValue(const T& value);
    explicit PureValue(T&& value);

    void onComplete(const std::function<void(const Result<T>&)>& callback) override;
    void consume(const std::function<void(const T&)>& callback) override;
    void onFail(const std::function<void(const Error&)>& callback) override;
    std::optional<Result<T>> get() const override;
    T await() override;

private:
    const T value;
};

template <class T>
PureValue<T>::PureValue(const T& value)
    : value(value)
{}

template <class T>
PureValue<T>::PureValue(T&& value)
    : value(std::move(value))
{}

template <class T>
void PureValue<T>::onComplete(const std::function<void(const Result<T>&)>& callback) {
    callback(Result<T>::left(value));
}

template <class T>
void PureValue<T>::consume(const std::function<void(const T&)>& callback) {
    callback(value);
}

template <class T>
void PureValue<T>::onFail(const std::function<void(const Error&)>&) {
    return;
}

template <class T>
std::optional<Result<T>> PureValue<T>::get() const {
    return Result<T>::left(value);
}

template <class T>
T PureValue<T>::await() {
    return value;
}

} // namespace cairn::value

#endif
