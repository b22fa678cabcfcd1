//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_TASK_DEF_H_
#define _CAIRN_TASK_DEF_H_

#include <any>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <typeindex>
#include <vector>

#include "Memoizer.hpp"
#include "TaskId.hpp"
#include "Value.hpp"

namespace cairn {

class EvalContext;

class TaskDef;
using TaskDefRef = std::shared_ptr<const TaskDef>;

/**
 * The untyped definition of a node in the task graph. This is what every
 * evaluation context operates on; `Task<T>` is the typed handle users
 * build graphs with.
 *
 * A definition is immutable. Its upstream list is supplied lazily and is
 * recomputed every time it is requested. Its id may be supplied lazily as
 * well, in which case it is computed once, on first request.
 */
class TaskDef {
public:
    /**
     * Expands the given task through the given context: evaluates its inputs
     * and invokes its process function once they are available.
     */
    using Code = std::function<ValueRef<std::any>(const TaskDef&, EvalContext&)>;
    using Identity = std::function<TaskId()>;
    using Upstreams = std::function<std::vector<TaskDefRef>()>;
    using MemoizerProvider = std::function<MemoizerBaseRef()>;

    static TaskDefRef create(
        TaskId id,
        std::type_index type,
        Upstreams upstreams,
        Code code,
        MemoizerProvider memoizerProvider = nullptr);

    /**
     * Create a definition whose id is computed on first request. Used when
     * the id depends on upstreams that are themselves supplied lazily.
     */
    static TaskDefRef createIdentifiedBy(
        Identity identity,
        std::type_index type,
        Upstreams upstreams,
        Code code,
        MemoizerProvider memoizerProvider = nullptr);

    TaskDef(
        Identity identity,
        std::type_index type,
        Upstreams upstreams,
        Code code,
        MemoizerProvider memoizerProvider);

    /**
     * @return The id of this task. Throws whatever the identity supplier
     *         throws; a failed computation is retried on the next request.
     */
    const TaskId& id() const;

    /**
     * @return The type of the value produced by this task.
     */
    std::type_index type() const;

    /**
     * @return The tasks this task directly depends on.
     */
    std::vector<TaskDefRef> upstreams() const;

    /**
     * Expand and evaluate this task through the given context.
     *
     * @param context The outermost context of the evaluation pipeline.
     * @return The value of this task.
     */
    ValueRef<std::any> expand(EvalContext& context) const;

    /**
     * @return The memoizer factory declared by the result type, or an empty
     *         function if the type declares none.
     */
    const MemoizerProvider& memoizerProvider() const;

private:
    const Identity identity;
    mutable std::once_flag identified;
    mutable std::optional<TaskId> taskId;
    const std::type_index resultType;
    const Upstreams upstreamList;
    const Code code;
    const MemoizerProvider provider;
};

} // namespace cairn

#endif
