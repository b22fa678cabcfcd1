//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_BUILDER_UTILS_H_
#define _CAIRN_BUILDER_UTILS_H_

#include <functional>
#include <vector>

namespace cairn::builder {

/**
 * Combine several deferred items into one deferred list. None of the
 * given functions is called until the returned function is - and they
 * are called again on every invocation. Nothing is cached.
 *
 * @param items The deferred items.
 * @return A function producing the list of items.
 */
template <class T>
std::function<std::vector<T>()> lazyList(std::vector<std::function<T()>> items) {
    return [items = std::move(items)]() {
        std::vector<T> result;
        result.reserve(items.size());
        for(auto& item : items) {
            result.push_back(item());
        }
        return result;
    };
}

/**
 * Combine several deferred lists into one deferred, concatenated list.
 * Retains the laziness of `lazyList`.
 *
 * @param lists The deferred lists.
 * @return A function producing the concatenation of all lists.
 */
template <class T>
std::function<std::vector<T>()> lazyFlatten(std::vector<std::function<std::vector<T>()>> lists) {
    return [lists = std::move(lists)]() {
        std::vector<T> result;
        for(auto& list : lists) {
            auto items = list();
            result.insert(result.end(), items.begin(), items.end());
        }
        return result;
    };
}

/**
 * @return A copy of `list` with `item` appended. `list` is left untouched.
 */
template <class T>
std::vector<T> appendToList(const std::vector<T>& list, T item) {
    std::vector<T> result;
    result.reserve(list.size() + 1);
    result.insert(result.end(), list.begin(), list.end());
    result.push_back(std::move(item));
    return result;
}

/**
 * Run an optional callback, such as an observer hook, such that nothing it
 * throws can escape. Exceptions are written to the diagnostic log.
 *
 * @param call The callback to run.
 */
void guardedCall(const std::function<void()>& call) noexcept;

} // namespace cairn::builder

#endif
