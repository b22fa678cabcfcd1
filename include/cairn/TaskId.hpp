//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _CAIRN_TASK_ID_H_
#define _CAIRN_TASK_ID_H_

#include <cstddef>
#include <functional>
#include <iomanip>
#include <limits>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace cairn {

/**
 * The structural identity of a task. Two tasks built from the same
 * declared type, name, arguments and upstream identities have equal
 * ids, and the memoizing context treats them as the same node of the
 * graph.
 *
 * Ids are cheap to copy; the key they compare by is shared between copies.
 */
class TaskId {
public:
    /**
     * A single task argument, kept as the type it was given as and an exact
     * rendering of its value. Strings of any flavor share one type.
     */
    struct Arg {
        std::string type;
        std::string value;

        bool operator==(const Arg& other) const;
        bool operator!=(const Arg& other) const;
        bool operator<(const Arg& other) const;
    };

    using Args = std::vector<Arg>;

    /**
     * Create an id from a task name and its arguments, with no declared
     * result type and no upstreams.
     *
     * @param name The name of the task.
     * @param args The arguments the task was constructed with.
     * @return The id of the task.
     */
    template <typename... Values>
    static TaskId create(const std::string& name, const Values&... args);

    /**
     * Create an id from every part of a task's structure.
     *
     * @param name The name of the task.
     * @param args The task arguments, see `argsOf`.
     * @param type The name of the declared result type.
     * @param upstreams The ids of the upstream tasks, in input order.
     * @return The id of the task.
     */
    static TaskId structural(
        const std::string& name,
        Args args,
        const std::string& type,
        std::vector<TaskId> upstreams);

    template <typename T>
    static Arg arg(const T& value);

    template <typename... Values>
    static Args argsOf(const Values&... values);

    const std::string& name() const;

    /**
     * @return The arguments rendered as a comma separated list. For display
     *         only; two different argument lists may render the same.
     */
    const std::string& args() const;

    const std::string& type() const;
    const std::vector<TaskId>& upstreams() const;
    std::size_t hash() const;

    /**
     * @return The id rendered as `name(args)#hash`.
     */
    std::string toString() const;

    bool operator==(const TaskId& other) const;
    bool operator!=(const TaskId& other) const;
    bool operator<(const TaskId& other) const;

private:
    struct Key;

    explicit TaskId(std::shared_ptr<const Key> key);

    std::shared_ptr<const Key> key;
};

std::ostream& operator<<(std::ostream& out, const TaskId& id);

template <typename... Values>
TaskId TaskId::create(const std::string& name, const Values&... args) {
    return structural(name, argsOf(args...), "", {});
}

template <typename T>
TaskId::Arg TaskId::arg(const T& value) {
    std::ostringstream out;

    if constexpr(std::is_convertible_v<const T&, std::string>) {
        return Arg{ "string", std::string(value) };
    } else if constexpr(std::is_floating_point_v<T>) {
        out << std::setprecision(std::numeric_limits<T>::max_digits10) << value;
    } else {
        out << value;
    }

    return Arg{ typeid(T).name(), out.str() };
}

template <typename... Values>
TaskId::Args TaskId::argsOf(const Values&... values) {
    return Args{ arg(values)... };
}

} // namespace cairn

namespace std {

template <>
struct hash<cairn::TaskId> {
    std::size_t operator()(const cairn::TaskId& id) const noexcept {
        return id.hash();
    }
};

} // namespace std

#endif
