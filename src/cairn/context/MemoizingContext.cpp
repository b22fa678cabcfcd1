//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/context/MemoizingContext.hpp"
#include <exception>

namespace cairn::context {

using memo::EvalBundle;
using memo::EvalBundleRef;

MemoizingContext::Builder::Builder(EvalContextPtr base)
    : base(std::move(base))
    , explicitMemoizers()
    , discovered()
{}

EvalContextPtr MemoizingContext::Builder::build() {
    return EvalContextPtr(new MemoizingContext(
        std::move(base),
        std::move(explicitMemoizers),
        std::move(discovered)));
}

EvalContextPtr MemoizingContext::composeWith(EvalContextPtr base) {
    return Builder(std::move(base)).build();
}

MemoizingContext::Builder MemoizingContext::builder(EvalContextPtr base) {
    return Builder(std::move(base));
}

MemoizingContext::MemoizingContext(
    EvalContextPtr base,
    memo::MemoizerRegistry::Memoizers explicitMemoizers,
    memo::MemoizerRegistry::Memoizers discovered)
    : ForwardingContext(std::move(base))
    , registry(std::move(explicitMemoizers), std::move(discovered))
    , session()
{}

ValueRef<std::any> MemoizingContext::evaluateInternal(const TaskDefRef& task, EvalContext& context) {
    auto memoizer = registry.resolve(*task);

    auto bundle = session.getOrCreate(task->id(), [this, &task, &memoizer] {
        return std::make_shared<EvalBundle>(task, inner().promise(), memoizer);
    });

    bundle->evaluate(inner(), context);
    return bundle->value();
}

ValueRef<std::any> MemoizingContext::invokeProcessFn(const TaskId& taskId, const ProcessFn& processFn) {
    EvalBundleRef bundle = session.await(taskId);
    auto stored = inner().promise();

    inner().invokeProcessFn(taskId, processFn)->onComplete([bundle, stored](const Result<std::any>& result) {
        if(result.is_right()) {
            stored->fail(result.get_right());
            return;
        }

        try {
            bundle->memoizer()->storeAny(*bundle->task(), result.get_left());
        } catch(...) {
            stored->fail(std::current_exception());
            return;
        }

        stored->set(result.get_left());
    });

    return stored->value();
}

} // namespace cairn::context
