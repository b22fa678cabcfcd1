//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/memo/MemoizerRegistry.hpp"
#include "cairn/ConstructionError.hpp"
#include <string>

namespace cairn::memo {

MemoizerRegistry::MemoizerRegistry(Memoizers explicitMemoizers, Memoizers discovered)
    : explicitMemoizers(std::move(explicitMemoizers))
    , mutex()
    , discoveries()
{
    for(auto& entry : discovered) {
        discoveries.emplace(entry.first, Discovery{entry.second, nullptr});
    }
}

MemoizerBaseRef MemoizerRegistry::resolve(const TaskDef& task) {
    auto type = task.type();

    auto registered = explicitMemoizers.find(type);
    if(registered != explicitMemoizers.end()) {
        return registered->second;
    }

    std::lock_guard<std::mutex> guard(mutex);

    auto found = discoveries.find(type);
    if(found == discoveries.end()) {
        Discovery discovery{MemoizerBase::noop(), nullptr};

        if(task.memoizerProvider()) {
            try {
                discovery.memoizer = runProvider(type, task.memoizerProvider());
            } catch(const ConstructionError&) {
                discovery.memoizer = nullptr;
                discovery.error = std::current_exception();
            }
        }

        found = discoveries.emplace(type, discovery).first;
    }

    if(found->second.error) {
        std::rethrow_exception(found->second.error);
    }

    return found->second.memoizer;
}

MemoizerBaseRef MemoizerRegistry::runProvider(std::type_index type, const TaskDef::MemoizerProvider& provider) {
    MemoizerBaseRef memoizer;

    try {
        memoizer = provider();
    } catch(const std::exception& error) {
        throw ConstructionError(std::string("Memoizer discovery failed for ") + type.name() + ": " + error.what());
    } catch(...) {
        throw ConstructionError(std::string("Memoizer discovery failed for ") + type.name() + ": unknown exception type");
    }

    if(memoizer == nullptr) {
        throw ConstructionError(std::string("Memoizer discovery failed for ") + type.name() + ": provider returned no memoizer");
    }

    return memoizer;
}

} // namespace cairn::memo
