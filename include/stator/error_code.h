#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/export.h"
#include <string>
#include <system_error>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \brief routing (bus and registry) error codes */
enum class error_code_t {
    success = 0,
    address_not_found,
    mailbox_closed,
    mailbox_full,
    send_timeout,
    request_timeout,
    registry_internal,
    route_misconfigured,
    payload_type_mismatch,
    already_registered,
    pool_not_found,
    message_expired,
};

/** \brief supervision error codes */
enum class supervision_code_t {
    success = 0,
    child_not_found,
    child_start_failed,
    child_stop_failed,
    restart_limit_exceeded,
    shutdown_timeout,
    tree_integrity_violation,
    health_monitoring_disabled,
    supervisor_shutting_down,
    escalated_failure,
    supervisor_not_found,
    health_check_failed,
};

namespace details {

/** \brief category support for `stator` routing error codes */
class STATOR_API error_code_category : public std::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

/** \brief category support for `stator` supervision error codes */
class STATOR_API supervision_code_category : public std::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

} // namespace details

/** \brief returns error code category for `stator` routing error codes */
STATOR_API const details::error_code_category &error_code_category();

/** \brief returns error code category for `stator` supervision error codes */
STATOR_API const details::supervision_code_category &supervision_code_category();

/** \brief makes `std::error_code` from stator error_code enumerations */
inline std::error_code make_error_code(const error_code_t e) { return {static_cast<int>(e), error_code_category()}; }

/** \brief makes `std::error_code` from stator supervision_code enumerations */
inline std::error_code make_error_code(const supervision_code_t e) {
    return {static_cast<int>(e), supervision_code_category()};
}

} // namespace stator

namespace std {
template <> struct is_error_code_enum<stator::error_code_t> : std::true_type {};
template <> struct is_error_code_enum<stator::supervision_code_t> : std::true_type {};
} // namespace std

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
