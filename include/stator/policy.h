#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "forward.hpp"

namespace stator {

/** \brief child restart policy */
enum class restart_policy_t {
    /** \brief always restart child */
    permanent,

    /** \brief restart child only when it terminated abnormally (with error) */
    transient,

    /** \brief never restart child */
    temporary,
};

/** \brief returns `true` if the child should be restarted in accordance with the policy */
inline bool should_restart(restart_policy_t policy, bool abnormal) noexcept {
    switch (policy) {
    case restart_policy_t::permanent:
        return true;
    case restart_policy_t::transient:
        return abnormal;
    case restart_policy_t::temporary:
        return false;
    }
    return false;
}

/** \brief how to shut a child down */
enum class shutdown_kind_t {
    /** \brief invoke `stop()` and wait at most the timeout, then terminate */
    graceful,

    /** \brief terminate child immediately, `stop()` is not invoked */
    immediate,

    /** \brief invoke `stop()` and wait for its completion, whatever long it takes */
    infinity,
};

/** \struct shutdown_policy_t
 *  \brief child shutdown policy: kind and the (graceful) timeout
 */
struct shutdown_policy_t {
    /** \brief shutdown kind */
    shutdown_kind_t kind = shutdown_kind_t::graceful;

    /** \brief max time for graceful shutdown */
    pt::time_duration timeout = pt::seconds{5};

    /** \brief graceful shutdown with the timeout */
    static shutdown_policy_t graceful(const pt::time_duration &timeout_) noexcept {
        return {shutdown_kind_t::graceful, timeout_};
    }

    /** \brief immediate shutdown */
    static shutdown_policy_t immediate() noexcept { return {shutdown_kind_t::immediate, pt::time_duration{}}; }

    /** \brief unbounded graceful shutdown */
    static shutdown_policy_t infinity() noexcept { return {shutdown_kind_t::infinity, pt::pos_infin}; }
};

/** \brief mailbox reaction on the attempt to put a message into the full mailbox */
enum class backpressure_t {
    /** \brief the sender waits until there is free space */
    block,

    /** \brief the message is silently dropped */
    drop,

    /** \brief the sender gets `mailbox_full` error */
    error,

    /** \brief the reaction depends on message priority, see `backpressure_for()` */
    adaptive,
};

/** \brief pool member selection strategy */
enum class pool_strategy_t {
    round_robin,
    random,
};

} // namespace stator
