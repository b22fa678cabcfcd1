//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_LOGGING_CONTEXT_H_
#define _CAIRN_LOGGING_CONTEXT_H_

#include "../ForwardingContext.hpp"
#include "../Logging.hpp"

namespace cairn::context {

/**
 * A context which reports evaluation events to a `Logging` observer and
 * times every process function invocation. Events describe the decorated
 * context, so placing this outside a `MemoizingContext` reports memoized
 * tasks as evaluated but never started.
 */
class LoggingContext final : public ForwardingContext {
public:
    static EvalContextPtr composeWith(EvalContextPtr base, LoggingRef logging);

    ValueRef<std::any> evaluateInternal(const TaskDefRef& task, EvalContext& context) override;
    ValueRef<std::any> invokeProcessFn(const TaskId& taskId, const ProcessFn& processFn) override;

private:
    LoggingContext(EvalContextPtr base, LoggingRef logging);

    LoggingRef logging;
};

} // namespace cairn::context

#endif
