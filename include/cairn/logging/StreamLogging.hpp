//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_STREAM_LOGGING_H_
#define _CAIRN_STREAM_LOGGING_H_

#include <iostream>
#include <mutex>
#include <string>

#include "../Logging.hpp"

namespace cairn::logging {

/**
 * Writes one line per evaluation event to an output stream:
 *
 *     will eval  report(2021-01-01)#3fa2c01b
 *     start eval report(2021-01-01)#3fa2c01b
 *     completed  report(2021-01-01)#3fa2c01b = 42 (1.25ms)
 *
 * Strings, numbers and booleans are printed. Other values are shown by
 * their type name.
 */
class StreamLogging final : public Logging {
public:
    static LoggingRef create(std::ostream& out = std::clog);

    explicit StreamLogging(std::ostream& out);

    void willEval(const TaskId& taskId) override;
    void startEval(const TaskId& taskId) override;
    void completedValue(const TaskId& taskId, const std::any& value, std::chrono::nanoseconds elapsed) override;
    void failedValue(const TaskId& taskId, const Error& error, std::chrono::nanoseconds elapsed) override;

    static std::string describe(const std::any& value);
    static std::string describe(const Error& error);

private:
    std::ostream& out;
    std::mutex mutex;
};

} // namespace cairn::logging

#endif
