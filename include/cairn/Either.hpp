//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_EITHER_H_
#define _CAIRN_EITHER_H_

#include <exception>
#include <optional>
#include <utility>

namespace cairn {

/**
 * An either holds one of two mutually exclusive values. It differs
 * from std::variant in that it can hold the same type for both the
 * left and right types while retaining explicit knowledge if the
 * value is the left or right result. Within cairn the left side is
 * always a successful result and the right side the failure that
 * replaced it.
 */
template <typename L, typename R>
class Either {
public:
    /**
     * Construct an either holding a left value.
     *
     * @param left The left value to hold.
     * @return An either holding the left result.
     */
    static Either<L,R> left(const L& left);

    /**
     * Construct an either holding a left value, taking ownership
     * of the given value.
     *
     * @param left The left value to hold.
     * @return An either holding the left result.
     */
    static Either<L,R> left(L&& left);

    /**
     * Construct an either holding a right value.
     *
     * @param right The right value to hold.
     * @return An either holding the right result.
     */
    static Either<L,R> right(const R& right);

    /**
     * Check if this either is holding the left result. If true
     * you can safely assume a call to `get_left` is safe.
     *
     * @return True iff this either is holding a left value.
     */
    bool is_left() const;

    /**
     * Check if this either is holding the right result. If true
     * you can safely assume a call to `get_right` is safe.
     *
     * @return True iff this either is holding a right value.
     */
    bool is_right() const;

    /**
     * Access the left result. Must be guarded by a call to
     * `is_left` as reading the wrong side is undefined.
     *
     * @return The left value.
     */
    const L& get_left() const;

    /**
     * Access the right result. Must be guarded by a call to
     * `is_right` as reading the wrong side is undefined.
     *
     * @return The right value.
     */
    const R& get_right() const;

    Either(const Either<L,R>&) = default;
    Either(Either<L,R>&&) noexcept = default;
    Either<L,R>& operator=(const Either<L,R>&) = default;
    Either<L,R>& operator=(Either<L,R>&&) noexcept = default;

private:
    Either() = default;
    std::optional<L> leftValue;
    std::optional<R> rightValue;
};

/**
 * The error side of every asynchronous result.
 */
using Error = std::exception_ptr;

template <typename T>
using Result = Either<T,Error>;

template <class L, class R>
Either<L,R> Either<L,R>::left(const L& left) {
    Either<L,R> either;
    either.leftValue = left;
    return either;
}

template <class L, class R>
Either<L,R> Either<L,R>::left(L&& left) {
    Either<L,R> either;
    either.leftValue = std::move(left);
    return either;
}

template <class L, class R>
Either<L,R> Either<L,R>::right(const R& right) {
    Either<L,R> either;
    either.rightValue = right;
    return either;
}

template <class L, class R>
bool Either<L,R>::is_left() const {
    return leftValue.has_value();
}

template <class L, class R>
bool Either<L,R>::is_right() const {
    return rightValue.has_value();
}

template <class L, class R>
const L& Either<L,R>::get_left() const {
    return *leftValue;
}

template <class L, class R>
const R& Either<L,R>::get_right() const {
    return *rightValue;
}

} // namespace cairn

#endif
