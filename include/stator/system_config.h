#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "monitor.h"
#include "policy.h"
#include "router.h"

namespace stator {

/** \struct system_config_t
 *  \brief the runtime-wide settings
 */
struct system_config_t {
    /** \brief amount of threads running the `io_context` */
    std::size_t worker_threads = 2;

    /** \brief amount of registry shards */
    std::size_t registry_shards = 16;

    /** \brief capacity of mailboxes created by the system context, `0` means unbounded */
    std::size_t mailbox_capacity = 1024;

    /** \brief reaction on the full mailbox */
    backpressure_t backpressure = backpressure_t::adaptive;

    /** \brief router delivery settings */
    router_config_t router = {};

    /** \brief default max time for the child start */
    pt::time_duration start_timeout = pt::seconds{5};

    /** \brief default max time for the child stop */
    pt::time_duration shutdown_timeout = pt::seconds{5};

    /** \brief bus events sink, the null one is used if it is not set */
    bus_monitor_ptr_t bus_monitor;
};

/** \struct system_config_builder_t
 *  \brief fluent system config builder
 */
struct STATOR_API system_config_builder_t {
    /** \brief the currently build config */
    system_config_t config;

    /** \brief sets amount of worker threads */
    system_config_builder_t &&worker_threads(std::size_t value) &&noexcept {
        config.worker_threads = value;
        return std::move(*this);
    }

    /** \brief sets amount of registry shards */
    system_config_builder_t &&registry_shards(std::size_t value) &&noexcept {
        config.registry_shards = value;
        return std::move(*this);
    }

    /** \brief sets default mailboxes capacity and backpressure */
    system_config_builder_t &&mailbox(std::size_t capacity, backpressure_t backpressure) &&noexcept {
        config.mailbox_capacity = capacity;
        config.backpressure = backpressure;
        return std::move(*this);
    }

    /** \brief sets max time, the router waits on the full mailbox */
    system_config_builder_t &&send_timeout(const pt::time_duration &value) &&noexcept {
        config.router.send_timeout = value;
        return std::move(*this);
    }

    /** \brief sets pool member selection strategy */
    system_config_builder_t &&pool_strategy(pool_strategy_t value) &&noexcept {
        config.router.pool_strategy = value;
        return std::move(*this);
    }

    /** \brief sets dead letters queue capacity */
    system_config_builder_t &&dead_letters_capacity(std::size_t value) &&noexcept {
        config.router.dead_letters_capacity = value;
        return std::move(*this);
    }

    /** \brief sets both default start and shutdown timeouts */
    system_config_builder_t &&timeout(const pt::time_duration &value) &&noexcept {
        config.start_timeout = config.shutdown_timeout = value;
        return std::move(*this);
    }

    /** \brief sets bus events sink */
    system_config_builder_t &&bus_monitor(bus_monitor_ptr_t value) &&noexcept {
        config.bus_monitor = std::move(value);
        return std::move(*this);
    }

    /** \brief checks whether config is valid */
    bool validate() const noexcept;

    /** \brief constructs system context from the current config, null is returned for invalid config */
    system_context_ptr_t finish() &&;
};

} // namespace stator
