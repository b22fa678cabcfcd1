//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_EVAL_SESSION_H_
#define _CAIRN_EVAL_SESSION_H_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <unordered_map>

#include "../Config.hpp"
#include "../TaskId.hpp"
#include "EvalBundle.hpp"

namespace cairn::memo {

/**
 * The registry of evaluation bundles for a single run of a pipeline.
 * Bundles are inserted once and never removed or replaced.
 */
class EvalSession {
public:
    using BundleFactory = std::function<EvalBundleRef()>;

    explicit EvalSession(std::chrono::milliseconds warningInterval = bundle_wait_warning_interval);

    EvalSession(const EvalSession&) = delete;
    EvalSession& operator=(const EvalSession&) = delete;

    /**
     * Find the bundle registered for `id`, registering the one built by
     * `factory` if there is none yet. Every caller for the same id gets
     * the same instance. The factory is called at most once per id, while
     * the registry is locked.
     *
     * @param id The id of the task.
     * @param factory Builds the bundle if the id is not registered.
     * @return The bundle for the id.
     */
    EvalBundleRef getOrCreate(const TaskId& id, const BundleFactory& factory);

    /**
     * Block until a bundle for `id` is registered. A warning is written to
     * the diagnostic log each time the warning interval passes without it
     * showing up. This never gives up.
     *
     * @param id The id of the task.
     * @return The bundle for the id.
     */
    EvalBundleRef await(const TaskId& id);

    std::size_t size() const;

private:
    const std::chrono::milliseconds warningInterval;
    mutable std::mutex mutex;
    std::condition_variable registered;
    std::unordered_map<TaskId, EvalBundleRef> bundles;
};

} // namespace cairn::memo

#endif
