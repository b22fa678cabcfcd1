//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_TRANSPORT_H_
#define _CAIRN_TRANSPORT_H_

#include <exception>
#include <sstream>
#include <string>
#include <type_traits>

#include <cereal/archives/binary.hpp>

#include "ConstructionError.hpp"

namespace cairn::builder {

/**
 * Check that a value captured by a task survives transport: it is written
 * to a cereal binary archive and read back. Use it on task arguments while
 * building a task so a value which cannot be moved to another executor
 * fails the construction of the task rather than its evaluation.
 *
 *     auto path = builder::requireTransportable(config.path, "path");
 *
 * `T` needs a cereal `serialize` (or `save`/`load`) and a default
 * constructor. Standard library types need the matching
 * `cereal/types/...` header included by the caller.
 *
 * @param value The value to check.
 * @param name The name of the argument, used in the error message.
 * @return The copy of `value` read back from the archive.
 * @throws ConstructionError If the value could not be written or read.
 */
template <class T>
T requireTransportable(const T& value, const std::string& name) {
    static_assert(std::is_default_constructible_v<T>,
        "requireTransportable requires a default constructible type.");

    std::stringstream buffer(std::ios::in | std::ios::out | std::ios::binary);
    T restored;

    try {
        {
            cereal::BinaryOutputArchive archive(buffer);
            archive(value);
        }

        cereal::BinaryInputArchive archive(buffer);
        archive(restored);
    } catch(const std::exception& error) {
        throw ConstructionError(name + " not transportable: " + error.what());
    }

    return restored;
}

} // namespace cairn::builder

#endif
