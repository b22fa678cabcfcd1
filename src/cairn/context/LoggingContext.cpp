//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/context/LoggingContext.hpp"
#include "cairn/BuilderUtils.hpp"
#include <stdexcept>

namespace cairn::context {

using builder::guardedCall;

EvalContextPtr LoggingContext::composeWith(EvalContextPtr base, LoggingRef logging) {
    return EvalContextPtr(new LoggingContext(std::move(base), std::move(logging)));
}

LoggingContext::LoggingContext(EvalContextPtr base, LoggingRef logging)
    : ForwardingContext(std::move(base))
    , logging(std::move(logging))
{
    if(this->logging == nullptr) {
        throw std::invalid_argument("A logging context requires a logging observer.");
    }
}

ValueRef<std::any> LoggingContext::evaluateInternal(const TaskDefRef& task, EvalContext& context) {
    guardedCall([this, &task] { logging->willEval(task->id()); });
    return ForwardingContext::evaluateInternal(task, context);
}

ValueRef<std::any> LoggingContext::invokeProcessFn(const TaskId& taskId, const ProcessFn& processFn) {
    guardedCall([this, &taskId] { logging->startEval(taskId); });

    auto start = std::chrono::steady_clock::now();
    auto result = ForwardingContext::invokeProcessFn(taskId, processFn);
    auto observer = logging;

    result->onComplete([observer, taskId, start](const Result<std::any>& outcome) {
        auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start);

        if(outcome.is_left()) {
            guardedCall([&] { observer->completedValue(taskId, outcome.get_left(), elapsed); });
        } else {
            guardedCall([&] { observer->failedValue(taskId, outcome.get_right(), elapsed); });
        }
    });

    return result;
}

} // namespace cairn::context
