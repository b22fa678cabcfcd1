//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/TaskDef.hpp"

namespace cairn {

TaskDefRef TaskDef::create(
    TaskId id,
    std::type_index type,
    Upstreams upstreams,
    Code code,
    MemoizerProvider memoizerProvider)
{
    return createIdentifiedBy(
        [id = std::move(id)]() { return id; },
        type,
        std::move(upstreams),
        std::move(code),
        std::move(memoizerProvider));
}

TaskDefRef TaskDef::createIdentifiedBy(
    Identity identity,
    std::type_index type,
    Upstreams upstreams,
    Code code,
    MemoizerProvider memoizerProvider)
{
    return std::make_shared<const TaskDef>(
        std::move(identity),
        type,
        std::move(upstreams),
        std::move(code),
        std::move(memoizerProvider));
}

TaskDef::TaskDef(
    Identity identity,
    std::type_index type,
    Upstreams upstreams,
    Code code,
    MemoizerProvider memoizerProvider)
    : identity(std::move(identity))
    , identified()
    , taskId()
    , resultType(type)
    , upstreamList(std::move(upstreams))
    , code(std::move(code))
    , provider(std::move(memoizerProvider))
{}

const TaskId& TaskDef::id() const {
    std::call_once(identified, [this] {
        taskId.emplace(identity());
    });

    return *taskId;
}

std::type_index TaskDef::type() const {
    return resultType;
}

std::vector<TaskDefRef> TaskDef::upstreams() const {
    if(upstreamList) {
        return upstreamList();
    } else {
        return {};
    }
}

ValueRef<std::any> TaskDef::expand(EvalContext& context) const {
    return code(*this, context);
}

const TaskDef::MemoizerProvider& TaskDef::memoizerProvider() const {
    return provider;
}

} // namespace cairn
