//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_EVAL_BUNDLE_H_
#define _CAIRN_EVAL_BUNDLE_H_

#include <atomic>
#include <memory>

#include "../EvalContext.hpp"
#include "../Memoizer.hpp"

namespace cairn::memo {

class EvalBundle;
using EvalBundleRef = std::shared_ptr<EvalBundle>;

/**
 * Binds a task to the promise of its value and the memoizer chosen for
 * its result type. There is exactly one bundle per task id in an
 * evaluation session and it lives as long as the session.
 *
 * Only the first call to `evaluate` does any work; every other caller
 * just observes `value`.
 */
class EvalBundle {
public:
    EvalBundle(TaskDefRef task, PromiseRef<std::any> promise, MemoizerBaseRef memoizer);

    /**
     * Produce the value of the task, at most once. A memoized value
     * completes the bundle without expanding the task. Otherwise the task
     * is expanded by `inner` and its value chained into the bundle.
     *
     * @param inner The context the memoizing context decorates.
     * @param context The outermost context of the evaluation pipeline.
     */
    void evaluate(EvalContext& inner, EvalContext& context);

    ValueRef<std::any> value() const;
    const TaskDefRef& task() const;
    const MemoizerBaseRef& memoizer() const;

private:
    const TaskDefRef taskDef;
    const PromiseRef<std::any> promise;
    const MemoizerBaseRef strategy;
    std::atomic_bool evaluated;
};

} // namespace cairn::memo

#endif
