//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/ForwardingContext.hpp"
#include <stdexcept>

namespace cairn {

ForwardingContext::ForwardingContext(EvalContextPtr delegate)
    : delegate(std::move(delegate))
{
    if(this->delegate == nullptr) {
        throw std::invalid_argument("A forwarding context requires a context to delegate to.");
    }
}

ValueRef<std::any> ForwardingContext::evaluateInternal(const TaskDefRef& task, EvalContext& context) {
    return delegate->evaluateInternal(task, context);
}

ValueRef<std::any> ForwardingContext::invokeProcessFn(const TaskId& taskId, const ProcessFn& processFn) {
    return delegate->invokeProcessFn(taskId, processFn);
}

ValueRef<std::any> ForwardingContext::value(const ProcessFn& fn) {
    return delegate->value(fn);
}

PromiseRef<std::any> ForwardingContext::promise() {
    return delegate->promise();
}

EvalContext& ForwardingContext::inner() {
    return *delegate;
}

} // namespace cairn
