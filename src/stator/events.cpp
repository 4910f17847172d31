//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/events.h"
#include <boost/uuid/uuid_io.hpp>
#include <sstream>

namespace stator {

const char *to_string(supervision_event_kind_t kind) noexcept {
    using kind_t = supervision_event_kind_t;
    switch (kind) {
    case kind_t::started:
        return "started";
    case kind_t::stopped:
        return "stopped";
    case kind_t::failed:
        return "failed";
    case kind_t::restarted:
        return "restarted";
    case kind_t::limit_exceeded:
        return "limit-exceeded";
    case kind_t::strategy_applied:
        return "strategy-applied";
    }
    return "unknown";
}

const char *to_string(bus_event_kind_t kind) noexcept {
    using kind_t = bus_event_kind_t;
    switch (kind) {
    case kind_t::published:
        return "published";
    case kind_t::delivered:
        return "delivered";
    case kind_t::undeliverable:
        return "undeliverable";
    case kind_t::expired:
        return "expired";
    case kind_t::request_timeout:
        return "request-timeout";
    case kind_t::late_reply:
        return "late-reply";
    }
    return "unknown";
}

const char *to_string(severity_t severity) noexcept {
    switch (severity) {
    case severity_t::trace:
        return "trace";
    case severity_t::debug:
        return "debug";
    case severity_t::info:
        return "info";
    case severity_t::warning:
        return "warning";
    case severity_t::error:
        return "error";
    case severity_t::critical:
        return "critical";
    }
    return "unknown";
}

severity_t supervision_event_t::severity() const noexcept {
    switch (kind) {
    case kind_t::started:
    case kind_t::stopped:
    case kind_t::strategy_applied:
        return severity_t::info;
    case kind_t::restarted:
        return severity_t::warning;
    case kind_t::failed:
        return severity_t::error;
    case kind_t::limit_exceeded:
        return severity_t::critical;
    }
    return severity_t::info;
}

std::string supervision_event_t::to_string() const noexcept {
    std::stringstream out;
    out << "[" << supervisor_id << "] " << stator::to_string(kind);
    if (child_id) {
        out << " child=" << *child_id;
    }
    for (auto &it : metadata) {
        out << " " << it.first << "=" << it.second;
    }
    return out.str();
}

severity_t bus_event_t::severity() const noexcept {
    switch (kind) {
    case kind_t::published:
    case kind_t::delivered:
        return severity_t::trace;
    case kind_t::request_timeout:
    case kind_t::late_reply:
        return severity_t::info;
    case kind_t::expired:
        return severity_t::warning;
    case kind_t::undeliverable:
        return severity_t::error;
    }
    return severity_t::info;
}

std::string bus_event_t::to_string() const noexcept {
    std::stringstream out;
    out << stator::to_string(kind);
    if (address) {
        out << " address=" << *address;
    }
    if (correlation_id) {
        out << " correlation=" << *correlation_id;
    }
    if (error) {
        out << " error='" << error->message() << "'";
    }
    return out.str();
}

} // namespace stator
