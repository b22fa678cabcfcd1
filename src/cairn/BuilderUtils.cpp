//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/BuilderUtils.hpp"
#include <exception>
#include <iostream>

namespace cairn::builder {

void guardedCall(const std::function<void()>& call) noexcept {
    try {
        call();
    } catch(const std::exception& error) {
        std::cerr << "Exception in guarded call: " << error.what() << std::endl;
    } catch(...) {
        std::cerr << "Exception in guarded call: unknown exception type" << std::endl;
    }
}

} // namespace cairn::builder
