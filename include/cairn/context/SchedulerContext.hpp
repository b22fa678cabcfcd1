//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_SCHEDULER_CONTEXT_H_
#define _CAIRN_SCHEDULER_CONTEXT_H_

#include "../EvalContext.hpp"
#include "../Scheduler.hpp"

namespace cairn::context {

/**
 * The innermost context of an evaluation pipeline. Expansion code runs
 * synchronously on the calling thread while process functions and lifted
 * computations are submitted to the given scheduler.
 */
class SchedulerContext final : public EvalContext {
public:
    static EvalContextPtr create(SchedulerRef sched);

    explicit SchedulerContext(SchedulerRef sched);

    ValueRef<std::any> evaluateInternal(const TaskDefRef& task, EvalContext& context) override;
    ValueRef<std::any> invokeProcessFn(const TaskId& taskId, const ProcessFn& processFn) override;
    ValueRef<std::any> value(const ProcessFn& fn) override;
    PromiseRef<std::any> promise() override;

private:
    SchedulerRef sched;
};

} // namespace cairn::context

#endif
