//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_TASK_H_
#define _CAIRN_TASK_H_

#include <any>
#include <functional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

#include "BuilderUtils.hpp"
#include "EvalContext.hpp"
#include "Memoizer.hpp"
#include "TaskDef.hpp"
#include "Values.hpp"

namespace cairn {

template <class T, class... Inputs>
class TaskBuilder;

/**
 * A Task is a typed handle to a node of a task graph producing a `T`. It
 * describes a computation that is _yet to happen_: nothing runs until the
 * task is evaluated through an `EvalContext`.
 *
 * Tasks are built with `named`:
 *
 *     auto c = Task<int>::named("c").process([]() { return 1; });
 *     auto b = Task<int>::named("b", 2)
 *         .input(c)
 *         .process([](int cv) { return cv * 2; });
 *
 * The id of a task is derived from its name, its arguments, its result type
 * and the ids of all of its inputs, so two structurally equal definitions
 * share an id. It is computed on first request, which forces any lazily
 * supplied inputs.
 */
template <class T>
class Task {
public:
    /**
     * Start building a task.
     *
     * @param name The name of the task.
     * @param args The arguments that, along with the name, identify the task.
     * @return A builder for the task.
     */
    template <typename... Args>
    static TaskBuilder<T> named(const std::string& name, const Args&... args) {
        return TaskBuilder<T>(name, TaskId::argsOf(args...));
    }

    explicit Task(TaskDefRef definition)
        : definition(std::move(definition))
    {}

    const TaskId& id() const {
        return definition->id();
    }

    const TaskDefRef& def() const {
        return definition;
    }

    std::vector<TaskDefRef> upstreams() const {
        return definition->upstreams();
    }

private:
    TaskDefRef definition;
};

/**
 * Accumulates the inputs of a task. Each call to `input` or `inputs` adds
 * one argument to the process function, in order.
 */
template <class T, class... Inputs>
class TaskBuilder {
public:
    TaskBuilder(std::string name, TaskId::Args args)
        : name(std::move(name))
        , args(std::move(args))
        , upstreamLists()
        , processArgs()
    {}

    /**
     * Add the value of another task as the next process function argument.
     */
    template <class U>
    TaskBuilder<T, Inputs..., U> input(const Task<U>& task) const {
        auto def = task.def();
        return extend<U>(
            builder::lazyList<TaskDefRef>({ [def]() { return def; } }),
            [def](EvalContext& context) { return context.evaluate(def); });
    }

    /**
     * Add the value of a lazily supplied task as the next process function
     * argument. The supplier is not called until the graph is expanded,
     * its upstreams are listed or the task id is first requested.
     */
    template <class U>
    TaskBuilder<T, Inputs..., U> input(std::function<Task<U>()> task) const {
        return extend<U>(
            builder::lazyList<TaskDefRef>({ [task]() { return task().def(); } }),
            [task](EvalContext& context) { return context.evaluate(task().def()); });
    }

    /**
     * Add the values of a list of tasks as the next process function
     * argument, passed as a `std::vector<U>`.
     */
    template <class U>
    TaskBuilder<T, Inputs..., std::vector<U>> inputs(const std::vector<Task<U>>& tasks) const {
        std::vector<std::function<TaskDefRef()>> deferred;
        std::vector<TaskDefRef> defs;

        for(auto& task : tasks) {
            auto def = task.def();
            deferred.emplace_back([def]() { return def; });
            defs.push_back(def);
        }

        return extend<std::vector<U>>(
            builder::lazyList<TaskDefRef>(std::move(deferred)),
            [defs](EvalContext& context) -> ValueRef<std::any> {
                std::vector<ValueRef<std::any>> values;
                values.reserve(defs.size());
                for(auto& def : defs) {
                    values.push_back(context.evaluate(def));
                }

                return Values::allOf(values)->template map<std::any>([](const std::vector<std::any>& results) {
                    std::vector<U> typed;
                    typed.reserve(results.size());
                    for(auto& result : results) {
                        typed.push_back(std::any_cast<const U&>(result));
                    }
                    return std::any(std::move(typed));
                });
            });
    }

    /**
     * Finish the task with its process function. The function is called with
     * one argument per input once every input has a value; if any input fails
     * the task fails with that error and the function is never called.
     *
     * @param fn The process function.
     * @return The built task.
     */
    template <class Fn>
    Task<T> process(Fn fn) const {
        static_assert(std::is_convertible_v<std::invoke_result_t<const Fn&, const Inputs&...>, T>,
            "The process function must accept the task inputs and return the task type.");

        auto upstreams = builder::lazyFlatten(upstreamLists);
        auto fnArgs = processArgs;

        TaskDef::Identity identity = [name = name, args = args, upstreams]() {
            std::vector<TaskId> upstreamIds;
            for(auto& upstream : upstreams()) {
                upstreamIds.push_back(upstream->id());
            }

            return TaskId::structural(name, args, typeid(T).name(), std::move(upstreamIds));
        };

        TaskDef::Code code = [fnArgs, fn](const TaskDef& task, EvalContext& context) -> ValueRef<std::any> {
            auto id = task.id();

            std::vector<ValueRef<std::any>> inputValues;
            inputValues.reserve(fnArgs.size());
            for(auto& arg : fnArgs) {
                inputValues.push_back(arg(context));
            }

            auto promise = context.promise();
            auto* outer = &context;

            Values::allOf(inputValues)->onComplete([id, fn, outer, promise](const Result<std::vector<std::any>>& gathered) {
                if(gathered.is_right()) {
                    promise->fail(gathered.get_right());
                    return;
                }

                auto inputs = gathered.get_left();
                ValueRef<std::any> result;

                try {
                    result = outer->invokeProcessFn(id, [fn, inputs]() {
                        return std::any(T(applyInputs(fn, inputs, std::index_sequence_for<Inputs...>())));
                    });
                } catch(...) {
                    promise->fail(std::current_exception());
                    return;
                }

                chain(result, promise);
            });

            return promise->value();
        };

        return Task<T>(TaskDef::createIdentifiedBy(
            std::move(identity),
            std::type_index(typeid(T)),
            std::move(upstreams),
            std::move(code),
            memoizerProviderFor<T>()));
    }

private:
    template <class, class...>
    friend class TaskBuilder;

    using ProcessFnArg = std::function<ValueRef<std::any>(EvalContext&)>;

    std::string name;
    TaskId::Args args;
    std::vector<std::function<std::vector<TaskDefRef>()>> upstreamLists;
    std::vector<ProcessFnArg> processArgs;

    template <class U>
    TaskBuilder<T, Inputs..., U> extend(
        std::function<std::vector<TaskDefRef>()> upstreams,
        ProcessFnArg arg) const
    {
        TaskBuilder<T, Inputs..., U> next(name, args);
        next.upstreamLists = builder::appendToList(upstreamLists, std::move(upstreams));
        next.processArgs = builder::appendToList(processArgs, std::move(arg));
        return next;
    }

    template <class Fn, std::size_t... I>
    static T applyInputs(const Fn& fn, const std::vector<std::any>& inputs, std::index_sequence<I...>) {
        return fn(std::any_cast<const Inputs&>(inputs[I])...);
    }
};

template <class T>
ValueRef<T> EvalContext::evaluate(const Task<T>& task) {
    return evaluate(task.def())->template map<T>([](const std::any& result) {
        return std::any_cast<T>(result);
    });
}

} // namespace cairn

#endif
