//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_EVAL_CONTEXT_H_
#define _CAIRN_EVAL_CONTEXT_H_

#include <any>
#include <functional>
#include <memory>

#include "Promise.hpp"
#include "TaskDef.hpp"
#include "TaskId.hpp"
#include "Value.hpp"

namespace cairn {

template <class T>
class Task;

class EvalContext;
using EvalContextPtr = std::unique_ptr<EvalContext>;

/**
 * An `EvalContext` defines how a task graph is evaluated. Every context
 * implements the same four operations - expansion of a task, invocation of
 * a task's process function, lifting of a plain computation, and creation
 * of a promise. Cross-cutting behavior such as memoization or logging is
 * layered on as decorators (see `ForwardingContext`) which override a
 * subset of the operations and delegate the rest.
 *
 * Contexts are composed explicitly and the composition order is observable:
 *
 *     auto context = LoggingContext::composeWith(
 *         MemoizingContext::composeWith(
 *             SchedulerContext::create(Scheduler::global())),
 *         logging);
 *
 * The outermost context must outlive every value it hands out.
 */
class EvalContext {
public:
    using ProcessFn = std::function<std::any()>;

    /**
     * Expand a task's dependencies and produce its value. Implementations
     * which need to evaluate further tasks must do so through `context` -
     * the outermost context of the pipeline - so that every decorator sees
     * the recursion.
     *
     * @param task The task to evaluate.
     * @param context The outermost context of the evaluation pipeline.
     * @return The value of the task.
     */
    virtual ValueRef<std::any> evaluateInternal(const TaskDefRef& task, EvalContext& context) = 0;

    /**
     * Run the process function of a task whose inputs are all available.
     *
     * @param taskId The id of the task being computed.
     * @param processFn The leaf computation of the task.
     * @return The value produced by the process function.
     */
    virtual ValueRef<std::any> invokeProcessFn(const TaskId& taskId, const ProcessFn& processFn) = 0;

    /**
     * Lift a plain computation into a value. Whether it runs eagerly or
     * deferred is up to the context's executor.
     *
     * @param fn The computation.
     * @return The value of the computation.
     */
    virtual ValueRef<std::any> value(const ProcessFn& fn) = 0;

    /**
     * @return A new unset promise.
     */
    virtual PromiseRef<std::any> promise() = 0;

    /**
     * Evaluate a task through this context.
     *
     * @param task The task to evaluate.
     * @return The value of the task.
     */
    ValueRef<std::any> evaluate(const TaskDefRef& task);

    /**
     * Evaluate a typed task through this context.
     *
     * @param task The task to evaluate.
     * @return The value of the task.
     */
    template <class T>
    ValueRef<T> evaluate(const Task<T>& task);

    virtual ~EvalContext() = default;
};

} // namespace cairn

#endif
