#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "monitor.h"
#include "strategy.h"
#include <optional>
#include <string>

namespace stator {

/** \struct health_config_t
 *  \brief periodic health checks settings
 */
struct health_config_t {
    /** \brief how often children are checked */
    pt::time_duration interval = pt::seconds{30};

    /** \brief max time for the single child health check; timed out check means failure */
    pt::time_duration check_timeout = pt::seconds{5};

    /** \brief amount of consecutive failed checks, after which the child is restarted */
    std::uint32_t failure_threshold = 3;
};

/** \struct supervisor_config_t
 *  \brief supervisor settings
 */
struct supervisor_config_t {
    /** \brief human-readable supervisor name (used in logs) */
    std::string identity = "supervisor";

    /** \brief how to behave if child fails */
    strategy_t strategy = strategy_t::isolate_one;

    /** \brief supervision events sink, the null one is used if it is not set */
    supervision_monitor_ptr_t monitor;

    /** \brief whether exhausted child restart budget should be reported as own failure */
    bool escalate_failure = false;

    /** \brief health checks settings, they are disabled if not set */
    std::optional<health_config_t> health;
};

/** \struct supervisor_config_builder_t
 *  \brief fluent supervisor config builder
 */
struct STATOR_API supervisor_config_builder_t {
    /** \brief refernce to `system_context_t` */
    system_context_t &system_context;

    /** \brief the currently build config */
    supervisor_config_t config;

    supervisor_config_builder_t(system_context_t &system_context_) noexcept : system_context{system_context_} {}

    /** \brief sets supervisor name */
    supervisor_config_builder_t &&identity(std::string value) &&noexcept {
        config.identity = std::move(value);
        return std::move(*this);
    }

    /** \brief sets supervision strategy */
    supervisor_config_builder_t &&strategy(strategy_t value) &&noexcept {
        config.strategy = value;
        return std::move(*this);
    }

    /** \brief sets supervision events sink */
    supervisor_config_builder_t &&monitor(supervision_monitor_ptr_t value) &&noexcept {
        config.monitor = std::move(value);
        return std::move(*this);
    }

    /** \brief report own failure to the parent, when a child exhausted its restart budget */
    supervisor_config_builder_t &&escalate_failure(bool value = true) &&noexcept {
        config.escalate_failure = value;
        return std::move(*this);
    }

    /** \brief enables periodic health checks */
    supervisor_config_builder_t &&health(const pt::time_duration &interval, const pt::time_duration &check_timeout,
                                         std::uint32_t failure_threshold) &&noexcept {
        config.health = health_config_t{interval, check_timeout, failure_threshold};
        return std::move(*this);
    }

    /** \brief checks whether config is valid */
    bool validate() const noexcept;

    /** \brief constructs and starts supervisor, null is returned for invalid config */
    supervisor_ptr_t finish() &&;
};

} // namespace stator
