#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include <functional>
#include "arc.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/uuid/uuid.hpp>

namespace stator {

struct address_t;
struct envelope_t;
struct mailbox_t;
struct registry_t;
struct bus_t;
struct router_t;
struct child_t;
struct supervisor_t;
struct system_context_t;
struct extended_error_t;

/** \brief intrusive pointer for envelope */
using envelope_ptr_t = intrusive_ptr_t<envelope_t>;

/** \brief intrusive pointer for mailbox */
using mailbox_ptr_t = intrusive_ptr_t<mailbox_t>;

/** \brief intrusive pointer for supervised child */
using child_ptr_t = intrusive_ptr_t<child_t>;

/** \brief intrusive pointer for supervisor */
using supervisor_ptr_t = intrusive_ptr_t<supervisor_t>;

/** \brief intrusive pointer for system context */
using system_context_ptr_t = intrusive_ptr_t<system_context_t>;

/** \brief intrusive pointer to exteneded error type */
using extended_error_ptr_t = intrusive_ptr_t<extended_error_t>;

namespace pt = boost::posix_time;

/** \brief request correlation identifier */
using correlation_id_t = boost::uuids::uuid;

/** \brief child identifier in the scope of the owning supervisor */
using child_id_t = boost::uuids::uuid;

/** \brief supervisor identifier (unique per process) */
using supervisor_id_t = boost::uuids::uuid;

/** \brief factory which creates new child instance on (re)start
 *
 * The factory might throw an exception; it is converted into
 * `child_start_failed` error by the supervisor.
 *
 */
using factory_t = std::function<child_ptr_t()>;

} // namespace stator
