//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/EvalContext.hpp"

namespace cairn {

ValueRef<std::any> EvalContext::evaluate(const TaskDefRef& task) {
    return evaluateInternal(task, *this);
}

} // namespace cairn
