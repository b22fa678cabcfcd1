//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/memo/EvalSession.hpp"
#include <iostream>

namespace cairn::memo {

EvalSession::EvalSession(std::chrono::milliseconds warningInterval)
    : warningInterval(warningInterval)
    , mutex()
    , registered()
    , bundles()
{}

EvalBundleRef EvalSession::getOrCreate(const TaskId& id, const BundleFactory& factory) {
    EvalBundleRef bundle;

    {
        std::lock_guard<std::mutex> guard(mutex);

        auto found = bundles.find(id);
        if(found != bundles.end()) {
            return found->second;
        }

        bundle = factory();
        bundles.emplace(id, bundle);
    }

    registered.notify_all();
    return bundle;
}

EvalBundleRef EvalSession::await(const TaskId& id) {
    std::unique_lock<std::mutex> lock(mutex);
    auto start = std::chrono::steady_clock::now();

    while(true) {
        auto found = bundles.find(id);
        if(found != bundles.end()) {
            return found->second;
        }

        bool visible = registered.wait_for(lock, warningInterval, [this, &id] {
            return bundles.find(id) != bundles.end();
        });

        if(!visible) {
            auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            std::cerr << "Still waiting for the evaluation bundle of " << id
                      << " after " << waited.count() << "ms" << std::endl;
        }
    }
}

std::size_t EvalSession::size() const {
    std::lock_guard<std::mutex> guard(mutex);
    return bundles.size();
}

} // namespace cairn::memo
