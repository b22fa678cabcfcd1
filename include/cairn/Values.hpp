//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_VALUES_H_
#define _CAIRN_VALUES_H_

#include <atomic>
#include <mutex>
#include <vector>
#include "Value.hpp"

namespace cairn {

/**
 * Combinators over collections of values.
 */
class Values {
public:
    /**
     * Gather a list of values into a single value holding the list of
     * their results, in the original order. The gathered value fails with
     * the first failure observed; results arriving after that are dropped.
     *
     * @param values The values to gather. May be empty.
     * @return A value of the gathered results.
     */
    template <class T>
    static ValueRef<std::vector<T>> allOf(const std::vector<ValueRef<T>>& values);
};

template <class T>
ValueRef<std::vector<T>> Values::allOf(const std::vector<ValueRef<T>>& values) {
    if(values.empty()) {
        return Value<std::vector<T>>::pure(std::vector<T>());
    }

    struct Gather {
        explicit Gather(std::size_t size)
            : mutex()
            , results(size)
            , remaining(size)
            , done(false)
            , promise(Promise<std::vector<T>>::create())
        {}

        std::mutex mutex;
        std::vector<std::optional<T>> results;
        std::size_t remaining;
        bool done;
        PromiseRef<std::vector<T>> promise;
    };

    auto gather = std::make_shared<Gather>(values.size());

    for(std::size_t i = 0; i < values.size(); i++) {
        values[i]->onComplete([gather, i](const Result<T>& result) {
            std::optional<Result<std::vector<T>>> completion;

            {
                std::lock_guard<std::mutex> guard(gather->mutex);
                if(gather->done) {
                    return;
                }

                if(result.is_right()) {
                    gather->done = true;
                    completion = Result<std::vector<T>>::right(result.get_right());
                } else {
                    gather->results[i] = result.get_left();
                    if(--gather->remaining == 0) {
                        std::vector<T> collected;
                        collected.reserve(gather->results.size());
                        for(auto& entry : gather->results) {
                            collected.emplace_back(std::move(*entry));
                        }
                        gather->done = true;
                        completion = Result<std::vector<T>>::left(std::move(collected));
                    }
                }
            }

            if(completion.has_value()) {
                gather->promise->complete(std::move(*completion));
            }
        });
    }

    return gather->promise->value();
}

} // namespace cairn

#endif
