//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_FORWARDING_CONTEXT_H_
#define _CAIRN_FORWARDING_CONTEXT_H_

#include "EvalContext.hpp"

namespace cairn {

/**
 * Base for context decorators. A forwarding context exclusively owns the
 * context it wraps and forwards every operation to it unmodified.
 * Subclasses override only the operations they decorate.
 */
class ForwardingContext : public EvalContext {
public:
    ValueRef<std::any> evaluateInternal(const TaskDefRef& task, EvalContext& context) override;
    ValueRef<std::any> invokeProcessFn(const TaskId& taskId, const ProcessFn& processFn) override;
    ValueRef<std::any> value(const ProcessFn& fn) override;
    PromiseRef<std::any> promise() override;

protected:
    /**
     * @param delegate The context to forward to. Must not be null.
     */
    explicit ForwardingContext(EvalContextPtr delegate);

    EvalContext& inner();

private:
    EvalContextPtr delegate;
};

} // namespace cairn

#endif
