//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "cairn/TaskId.hpp"
#include <algorithm>
#include <iomanip>

namespace cairn {

namespace {

std::size_t combine(std::size_t seed, std::size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

} // namespace

struct TaskId::Key {
    std::string name;
    Args args;
    std::string type;
    std::vector<TaskId> upstreams;
    std::string rendered;
    std::size_t hash;
};

bool TaskId::Arg::operator==(const Arg& other) const {
    return type == other.type && value == other.value;
}

bool TaskId::Arg::operator!=(const Arg& other) const {
    return !(*this == other);
}

bool TaskId::Arg::operator<(const Arg& other) const {
    if(type != other.type) {
        return type < other.type;
    } else {
        return value < other.value;
    }
}

TaskId::TaskId(std::shared_ptr<const Key> key)
    : key(std::move(key))
{}

TaskId TaskId::structural(
    const std::string& name,
    Args args,
    const std::string& type,
    std::vector<TaskId> upstreams)
{
    std::hash<std::string> hasher;
    std::size_t hash = hasher(name);
    std::string rendered;

    hash = combine(hash, hasher(type));
    hash = combine(hash, args.size());

    for(auto& arg : args) {
        hash = combine(hash, hasher(arg.type));
        hash = combine(hash, hasher(arg.value));

        if(!rendered.empty()) {
            rendered += ", ";
        }
        rendered += arg.value;
    }

    hash = combine(hash, upstreams.size());

    for(auto& upstream : upstreams) {
        hash = combine(hash, upstream.hash());
    }

    return TaskId(std::make_shared<const Key>(Key{
        name,
        std::move(args),
        type,
        std::move(upstreams),
        std::move(rendered),
        hash
    }));
}

const std::string& TaskId::name() const {
    return key->name;
}

const std::string& TaskId::args() const {
    return key->rendered;
}

const std::string& TaskId::type() const {
    return key->type;
}

const std::vector<TaskId>& TaskId::upstreams() const {
    return key->upstreams;
}

std::size_t TaskId::hash() const {
    return key->hash;
}

std::string TaskId::toString() const {
    std::ostringstream out;
    out << *this;
    return out.str();
}

bool TaskId::operator==(const TaskId& other) const {
    if(key == other.key) {
        return true;
    }

    return key->hash == other.key->hash
        && key->name == other.key->name
        && key->type == other.key->type
        && key->args == other.key->args
        && key->upstreams == other.key->upstreams;
}

bool TaskId::operator!=(const TaskId& other) const {
    return !(*this == other);
}

bool TaskId::operator<(const TaskId& other) const {
    if(key == other.key) {
        return false;
    } else if(key->name != other.key->name) {
        return key->name < other.key->name;
    } else if(key->type != other.key->type) {
        return key->type < other.key->type;
    } else if(key->args != other.key->args) {
        return key->args < other.key->args;
    } else {
        return std::lexicographical_compare(
            key->upstreams.begin(), key->upstreams.end(),
            other.key->upstreams.begin(), other.key->upstreams.end());
    }
}

std::ostream& operator<<(std::ostream& out, const TaskId& id) {
    auto flags = out.flags();
    auto fill = out.fill();
    out << id.name() << "(" << id.args() << ")#" << std::hex << std::setw(8) << std::setfill('0')
        << (id.hash() & 0xffffffffULL);
    out.flags(flags);
    out.fill(fill);
    return out;
}

} // namespace cairn
