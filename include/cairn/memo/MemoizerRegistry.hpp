//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_MEMOIZER_REGISTRY_H_
#define _CAIRN_MEMOIZER_REGISTRY_H_

#include <exception>
#include <mutex>
#include <typeindex>
#include <unordered_map>

#include "../Memoizer.hpp"
#include "../TaskDef.hpp"

namespace cairn::memo {

/**
 * Chooses the memoizer for a task by its result type. Explicitly
 * registered memoizers always win. Otherwise the provider the result type
 * declares is run - at most once per type - and its outcome is cached,
 * failures included. Types without a provider get the no-op memoizer.
 */
class MemoizerRegistry {
public:
    using Memoizers = std::unordered_map<std::type_index, MemoizerBaseRef>;

    /**
     * @param explicitMemoizers Memoizers registered by type.
     * @param discovered Memoizers already discovered ahead of evaluation.
     */
    MemoizerRegistry(Memoizers explicitMemoizers, Memoizers discovered);

    MemoizerRegistry(const MemoizerRegistry&) = delete;
    MemoizerRegistry& operator=(const MemoizerRegistry&) = delete;

    /**
     * Choose the memoizer for the given task.
     *
     * @param task The task to choose a memoizer for.
     * @return The memoizer for the task's result type.
     * @throws ConstructionError If the result type's provider failed.
     */
    MemoizerBaseRef resolve(const TaskDef& task);

    /**
     * Run a memoizer provider, turning any failure into a
     * `ConstructionError` naming the type.
     *
     * @param type The result type the provider belongs to.
     * @param provider The provider to run.
     * @return The provided memoizer.
     */
    static MemoizerBaseRef runProvider(std::type_index type, const TaskDef::MemoizerProvider& provider);

private:
    struct Discovery {
        MemoizerBaseRef memoizer;
        std::exception_ptr error;
    };

    const Memoizers explicitMemoizers;
    std::mutex mutex;
    std::unordered_map<std::type_index, Discovery> discoveries;
};

} // namespace cairn::memo

#endif
