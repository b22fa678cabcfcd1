//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_MEMOIZING_CONTEXT_H_
#define _CAIRN_MEMOIZING_CONTEXT_H_

#include <typeindex>

#include "../ForwardingContext.hpp"
#include "../Memoizer.hpp"
#include "../memo/EvalSession.hpp"
#include "../memo/MemoizerRegistry.hpp"

namespace cairn::context {

/**
 * A context which evaluates every task at most once per run and skips
 * expansion of any task whose memoizer already holds a value for it.
 *
 * For every task the context keeps an `EvalBundle` in its session. The
 * first caller looks the task up in its memoizer and, on a miss, expands
 * it through the decorated context. Values produced by process functions
 * are stored with the memoizer before they are handed on - and only if the
 * process function succeeded.
 *
 * Memoizers are chosen by the task's result type:
 *
 *     auto context = MemoizingContext::builder(std::move(base))
 *         .memoizer<Report>(reportCache)
 *         .discover<Summary>()
 *         .build();
 *
 * A built context is a single run. Compose a new one for an independent run.
 */
class MemoizingContext final : public ForwardingContext {
public:
    class Builder {
    public:
        explicit Builder(EvalContextPtr base);

        /**
         * Use the given memoizer for every task producing a `T`. Takes
         * precedence over any provider `T` declares.
         */
        template <class T>
        Builder& memoizer(MemoizerRef<T> strategy);

        /**
         * Run the memoizer provider `T` declares right away instead of on
         * first evaluation of a `T` task.
         *
         * @throws ConstructionError If the provider fails.
         */
        template <class T>
        Builder& discover();

        EvalContextPtr build();

    private:
        EvalContextPtr base;
        memo::MemoizerRegistry::Memoizers explicitMemoizers;
        memo::MemoizerRegistry::Memoizers discovered;
    };

    /**
     * Decorate `base` with memoization, discovering memoizers lazily.
     */
    static EvalContextPtr composeWith(EvalContextPtr base);

    static Builder builder(EvalContextPtr base);

    ValueRef<std::any> evaluateInternal(const TaskDefRef& task, EvalContext& context) override;
    ValueRef<std::any> invokeProcessFn(const TaskId& taskId, const ProcessFn& processFn) override;

private:
    MemoizingContext(
        EvalContextPtr base,
        memo::MemoizerRegistry::Memoizers explicitMemoizers,
        memo::MemoizerRegistry::Memoizers discovered);

    memo::MemoizerRegistry registry;
    memo::EvalSession session;
};

template <class T>
MemoizingContext::Builder& MemoizingContext::Builder::memoizer(MemoizerRef<T> strategy) {
    explicitMemoizers[std::type_index(typeid(T))] = std::move(strategy);
    return *this;
}

template <class T>
MemoizingContext::Builder& MemoizingContext::Builder::discover() {
    static_assert(has_memoizer_provider_v<T>,
        "discover<T>() requires T to declare static MemoizerRef<T> memoizer().");

    auto type = std::type_index(typeid(T));
    discovered[type] = memo::MemoizerRegistry::runProvider(type, memoizerProviderFor<T>());
    return *this;
}

} // namespace cairn::context

#endif
