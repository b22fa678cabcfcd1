//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_CONSTRUCTION_ERROR_H_
#define _CAIRN_CONSTRUCTION_ERROR_H_

#include <stdexcept>
#include <string>

namespace cairn {

/**
 * Raised synchronously when a graph or pipeline cannot be configured:
 * a memoizer provider that throws, or a task argument which cannot be
 * transported. Construction errors are never retried.
 */
class ConstructionError : public std::runtime_error {
public:
    explicit ConstructionError(const std::string& message)
        : std::runtime_error(message)
    {}
};

} // namespace cairn

#endif
