//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/context/SchedulerContext.hpp"
#include <exception>
#include <stdexcept>

namespace cairn::context {

EvalContextPtr SchedulerContext::create(SchedulerRef sched) {
    return std::make_unique<SchedulerContext>(std::move(sched));
}

SchedulerContext::SchedulerContext(SchedulerRef sched)
    : sched(std::move(sched))
{
    if(this->sched == nullptr) {
        throw std::invalid_argument("A scheduler context requires a scheduler.");
    }
}

ValueRef<std::any> SchedulerContext::evaluateInternal(const TaskDefRef& task, EvalContext& context) {
    try {
        return task->expand(context);
    } catch(...) {
        return Value<std::any>::failed(std::current_exception());
    }
}

ValueRef<std::any> SchedulerContext::invokeProcessFn(const TaskId&, const ProcessFn& processFn) {
    return value(processFn);
}

ValueRef<std::any> SchedulerContext::value(const ProcessFn& fn) {
    auto result = Promise<std::any>::create();

    sched->submit([fn, result]() {
        std::any computed;

        try {
            computed = fn();
        } catch(...) {
            result->fail(std::current_exception());
            return;
        }

        result->set(std::move(computed));
    });

    return result->value();
}

PromiseRef<std::any> SchedulerContext::promise() {
    return Promise<std::any>::create();
}

} // namespace cairn::context
