//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_MEMOIZER_H_
#define _CAIRN_MEMOIZER_H_

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>

namespace cairn {

class TaskDef;

class MemoizerBase;
using MemoizerBaseRef = std::shared_ptr<MemoizerBase>;

template <class T>
class Memoizer;

template <class T>
using MemoizerRef = std::shared_ptr<Memoizer<T>>;

/**
 * The type-erased face of a memoizer, as seen by the memoizing context.
 * Implementations should derive from `Memoizer<T>` instead.
 */
class MemoizerBase {
public:
    /**
     * A memoizer for any type that never finds a value and stores nothing.
     */
    static MemoizerBaseRef noop();

    virtual std::optional<std::any> lookupAny(const TaskDef& task) = 0;
    virtual void storeAny(const TaskDef& task, const std::any& value) = 0;

    virtual ~MemoizerBase() = default;
};

/**
 * A memoization strategy for tasks producing a `T`.
 *
 * Returning a value from `lookup` stops further evaluation of the task's
 * upstreams: the graph is short-circuited at that node and the value is
 * used as input to dependent tasks. `store` is called exactly once for
 * every successful evaluation of the task's process function.
 *
 * A memoizer must not hold on to the evaluation context. It should keep
 * its values in a store of its own - typically one that outlives a single
 * evaluation. Both methods may be called concurrently for different tasks.
 *
 * A type can provide its own strategy by declaring a static factory:
 *
 *     struct Report {
 *         static cairn::MemoizerRef<Report> memoizer();
 *     };
 *
 * which is discovered at compile time (see `has_memoizer_provider`).
 */
template <class T>
class Memoizer : public MemoizerBase {
public:
    /**
     * A memoizer that does nothing and always returns empty lookups.
     */
    static MemoizerRef<T> noop();

    /**
     * Lookup a memoized value for a given task.
     *
     * @param task The task for which the lookup is made.
     * @return An optional memoized value for the task.
     */
    virtual std::optional<T> lookup(const TaskDef& task) = 0;

    /**
     * Store an evaluated value for a given task.
     *
     * @param task The task for which the value was produced.
     * @param value The value that was produced.
     */
    virtual void store(const TaskDef& task, const T& value) = 0;

    std::optional<std::any> lookupAny(const TaskDef& task) final {
        auto found = lookup(task);
        if(found.has_value()) {
            return std::any(std::move(*found));
        } else {
            return std::nullopt;
        }
    }

    void storeAny(const TaskDef& task, const std::any& value) final {
        store(task, std::any_cast<const T&>(value));
    }
};

namespace memo {

template <class T>
class NoopMemoizer final : public Memoizer<T> {
public:
    std::optional<T> lookup(const TaskDef&) override {
        return std::nullopt;
    }

    void store(const TaskDef&, const T&) override {}
};

class ErasedNoopMemoizer final : public MemoizerBase {
public:
    std::optional<std::any> lookupAny(const TaskDef&) override {
        return std::nullopt;
    }

    void storeAny(const TaskDef&, const std::any&) override {}
};

} // namespace memo

inline MemoizerBaseRef MemoizerBase::noop() {
    static MemoizerBaseRef instance = std::make_shared<memo::ErasedNoopMemoizer>();
    return instance;
}

template <class T>
MemoizerRef<T> Memoizer<T>::noop() {
    return std::make_shared<memo::NoopMemoizer<T>>();
}

/**
 * Detects a `static MemoizerRef<T> T::memoizer()` provider on a result type.
 */
template <class T, class = void>
struct has_memoizer_provider : std::false_type {};

template <class T>
struct has_memoizer_provider<T, std::void_t<decltype(T::memoizer())>>
    : std::is_convertible<decltype(T::memoizer()), MemoizerRef<T>> {};

template <class T>
constexpr bool has_memoizer_provider_v = has_memoizer_provider<T>::value;

/**
 * A factory for the memoizer a result type provides for itself - or an
 * empty function if the type declares no provider.
 */
template <class T>
std::function<MemoizerBaseRef()> memoizerProviderFor() {
    if constexpr (has_memoizer_provider_v<T>) {
        return []() -> MemoizerBaseRef { return T::memoizer(); };
    } else {
        return nullptr;
    }
}

} // namespace cairn

#endif
