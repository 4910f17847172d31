#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "address.hpp"
#include "extended_error.h"
#include <map>
#include <optional>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \brief event severity, in ascending order */
enum class severity_t { trace = 0, debug, info, warning, error, critical };

/** \brief free-form event metadata */
using metadata_t = std::map<std::string, std::string>;

/** \brief supervision event kind */
enum class supervision_event_kind_t {
    started,
    stopped,
    failed,
    restarted,
    limit_exceeded,
    strategy_applied,
};

/** \struct supervision_event_t
 *  \brief immutable record about something happened with a supervised child
 */
struct STATOR_API supervision_event_t {
    /** \brief alias for event kind */
    using kind_t = supervision_event_kind_t;

    /** \brief when the event has been emitted (UTC) */
    pt::ptime timestamp;

    /** \brief identity of the emitting supervisor */
    std::string supervisor_id;

    /** \brief identity of the child, if the event is child-related */
    std::optional<std::string> child_id;

    /** \brief event kind */
    kind_t kind;

    /** \brief additional details, i.e. error message or restart count */
    metadata_t metadata;

    /** \brief event severity, derived from the kind */
    severity_t severity() const noexcept;

    /** \brief human-readable event representation */
    std::string to_string() const noexcept;
};

/** \brief bus event kind */
enum class bus_event_kind_t {
    published,
    delivered,
    undeliverable,
    expired,
    request_timeout,
    late_reply,
};

/** \struct bus_event_t
 *  \brief immutable record about message routing
 */
struct STATOR_API bus_event_t {
    /** \brief alias for event kind */
    using kind_t = bus_event_kind_t;

    /** \brief when the event has been emitted (UTC) */
    pt::ptime timestamp;

    /** \brief event kind */
    kind_t kind;

    /** \brief message recipient, if known */
    std::optional<address_t> address;

    /** \brief request correlation id, if any */
    std::optional<correlation_id_t> correlation_id;

    /** \brief routing error, if any */
    extended_error_ptr_t error;

    /** \brief event severity, derived from the kind */
    severity_t severity() const noexcept;

    /** \brief human-readable event representation */
    std::string to_string() const noexcept;
};

/** \brief returns current UTC time with microseconds precision */
inline pt::ptime utc_now() noexcept { return pt::microsec_clock::universal_time(); }

STATOR_API const char *to_string(supervision_event_kind_t kind) noexcept;
STATOR_API const char *to_string(bus_event_kind_t kind) noexcept;
STATOR_API const char *to_string(severity_t severity) noexcept;

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
