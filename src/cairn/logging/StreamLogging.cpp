//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/logging/StreamLogging.hpp"
#include <exception>
#include <iomanip>
#include <sstream>

namespace cairn::logging {

namespace {

std::string formatElapsed(std::chrono::nanoseconds elapsed) {
    std::ostringstream formatted;
    formatted << std::fixed << std::setprecision(2)
              << std::chrono::duration<double, std::milli>(elapsed).count() << "ms";
    return formatted.str();
}

template <class T>
bool describeAs(const std::any& value, std::ostream& out) {
    if(auto typed = std::any_cast<T>(&value)) {
        out << *typed;
        return true;
    } else {
        return false;
    }
}

} // namespace

LoggingRef StreamLogging::create(std::ostream& out) {
    return std::make_shared<StreamLogging>(out);
}

StreamLogging::StreamLogging(std::ostream& out)
    : out(out)
    , mutex()
{}

void StreamLogging::willEval(const TaskId& taskId) {
    std::lock_guard<std::mutex> guard(mutex);
    out << "will eval  " << taskId << std::endl;
}

void StreamLogging::startEval(const TaskId& taskId) {
    std::lock_guard<std::mutex> guard(mutex);
    out << "start eval " << taskId << std::endl;
}

void StreamLogging::completedValue(const TaskId& taskId, const std::any& value, std::chrono::nanoseconds elapsed) {
    auto description = describe(value);
    std::lock_guard<std::mutex> guard(mutex);
    out << "completed  " << taskId << " = " << description << " (" << formatElapsed(elapsed) << ")" << std::endl;
}

void StreamLogging::failedValue(const TaskId& taskId, const Error& error, std::chrono::nanoseconds elapsed) {
    auto description = describe(error);
    std::lock_guard<std::mutex> guard(mutex);
    out << "failed     " << taskId << ": " << description << " (" << formatElapsed(elapsed) << ")" << std::endl;
}

std::string StreamLogging::describe(const std::any& value) {
    std::ostringstream described;
    described << std::boolalpha;

    bool printed = describeAs<std::string>(value, described)
        || describeAs<const char*>(value, described)
        || describeAs<bool>(value, described)
        || describeAs<int>(value, described)
        || describeAs<unsigned int>(value, described)
        || describeAs<long>(value, described)
        || describeAs<unsigned long>(value, described)
        || describeAs<long long>(value, described)
        || describeAs<unsigned long long>(value, described)
        || describeAs<float>(value, described)
        || describeAs<double>(value, described);

    if(!printed) {
        if(value.has_value()) {
            described << "<" << value.type().name() << ">";
        } else {
            described << "<empty>";
        }
    }

    return described.str();
}

std::string StreamLogging::describe(const Error& error) {
    if(!error) {
        return "unknown error";
    }

    try {
        std::rethrow_exception(error);
    } catch(const std::exception& thrown) {
        return thrown.what();
    } catch(...) {
        return "unknown exception type";
    }
}

} // namespace cairn::logging
