//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/memo/EvalBundle.hpp"
#include <exception>
#include <optional>

namespace cairn::memo {

EvalBundle::EvalBundle(TaskDefRef task, PromiseRef<std::any> promise, MemoizerBaseRef memoizer)
    : taskDef(std::move(task))
    , promise(std::move(promise))
    , strategy(std::move(memoizer))
    , evaluated(false)
{}

void EvalBundle::evaluate(EvalContext& inner, EvalContext& context) {
    if(evaluated.exchange(true)) {
        return;
    }

    std::optional<std::any> memoized;
    ValueRef<std::any> expanded;

    try {
        memoized = strategy->lookupAny(*taskDef);
        if(!memoized.has_value()) {
            expanded = inner.evaluateInternal(taskDef, context);
        }
    } catch(...) {
        promise->fail(std::current_exception());
        return;
    }

    if(memoized.has_value()) {
        promise->set(std::move(*memoized));
    } else {
        chain(expanded, promise);
    }
}

ValueRef<std::any> EvalBundle::value() const {
    return promise->value();
}

const TaskDefRef& EvalBundle::task() const {
    return taskDef;
}

const MemoizerBaseRef& EvalBundle::memoizer() const {
    return strategy;
}

} // namespace cairn::memo
