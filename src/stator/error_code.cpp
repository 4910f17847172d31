//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/error_code.h"

namespace stator {
namespace details {

const char *error_code_category::name() const noexcept { return "stator_error"; }
const char *supervision_code_category::name() const noexcept { return "stator_supervision"; }

std::string error_code_category::message(int c) const {
    switch (static_cast<error_code_t>(c)) {
    case error_code_t::success:
        return "success";
    case error_code_t::address_not_found:
        return "address is not registered";
    case error_code_t::mailbox_closed:
        return "mailbox is closed";
    case error_code_t::mailbox_full:
        return "mailbox is full";
    case error_code_t::send_timeout:
        return "send timeout";
    case error_code_t::request_timeout:
        return "request timeout";
    case error_code_t::registry_internal:
        return "registry internal error";
    case error_code_t::route_misconfigured:
        return "message route is misconfigured (no recipient)";
    case error_code_t::payload_type_mismatch:
        return "payload type mismatch";
    case error_code_t::already_registered:
        return "address is already registered";
    case error_code_t::pool_not_found:
        return "actor pool is unknown or empty";
    case error_code_t::message_expired:
        return "message time to live has elapsed";
    }
    return "unknown";
}

std::string supervision_code_category::message(int c) const {
    switch (static_cast<supervision_code_t>(c)) {
    case supervision_code_t::success:
        return "success";
    case supervision_code_t::child_not_found:
        return "child is not found";
    case supervision_code_t::child_start_failed:
        return "child start failed";
    case supervision_code_t::child_stop_failed:
        return "child stop failed";
    case supervision_code_t::restart_limit_exceeded:
        return "restart limit exceeded";
    case supervision_code_t::shutdown_timeout:
        return "child shutdown timeout";
    case supervision_code_t::tree_integrity_violation:
        return "supervisor tree integrity violation";
    case supervision_code_t::health_monitoring_disabled:
        return "health monitoring is not enabled";
    case supervision_code_t::supervisor_shutting_down:
        return "supervisor is shutting down";
    case supervision_code_t::escalated_failure:
        return "failure escalation (child restart budget exhausted)";
    case supervision_code_t::supervisor_not_found:
        return "supervisor is not found";
    case supervision_code_t::health_check_failed:
        return "child health check failed";
    }
    return "unknown supervision error";
}

} // namespace details
} // namespace stator

namespace stator {

const static details::error_code_category error_category;
const static details::supervision_code_category supervision_category;
const details::error_code_category &error_code_category() { return error_category; }
const details::supervision_code_category &supervision_code_category() { return supervision_category; }

} // namespace stator
