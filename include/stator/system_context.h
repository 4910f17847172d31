#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "system_config.h"
#include "supervisor_config.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \struct system_context_t
 *  \brief The system context holds the runtime-wide resources: the
 *  worker threads pool, the registry, the bus and the router.
 *
 * The resources are created with the context, and the worker threads
 * and the router are started by `start()`. All other components
 * (supervisors, actors, health monitors) get references to them.
 *
 * The `shutdown()` stops the router, completes pending requests with
 * empty replies and joins the worker threads. All supervisors should be
 * shut down before the system context is destroyed.
 *
 */
struct STATOR_API system_context_t : arc_base_t<system_context_t> {
    /** \brief work guard type, which keeps `io_context` running */
    using guard_t = asio::executor_work_guard<asio::io_context::executor_type>;

    system_context_t(const system_config_t &config = {}) noexcept;

    system_context_t(const system_context_t &) = delete;
    system_context_t(system_context_t &&) = delete;
    virtual ~system_context_t();

    /** \brief returns system config builder */
    static system_config_builder_t configure() noexcept { return {}; }

    /** \brief launches worker threads and the router */
    extended_error_ptr_t start() noexcept;

    /** \brief stops the router and joins worker threads, it is safe to call it multiple times */
    void shutdown() noexcept;

    /** \brief whether the shutdown has been initiated */
    inline bool is_shutting_down() const noexcept { return shutdown_flag.load(std::memory_order_acquire); }

    /** \brief the flag, which is raised upon shutdown */
    inline const std::atomic_bool &get_shutdown_flag() const noexcept { return shutdown_flag; }

    /** \brief returns builder for a supervisor */
    supervisor_config_builder_t create_supervisor() noexcept;

    /** \brief creates new mailbox with the default capacity and backpressure */
    mailbox_ptr_t make_mailbox() const noexcept;

    /** \brief creates new actor (not started yet) */
    template <typename Actor, typename... Args> intrusive_ptr_t<Actor> make_actor(Args &&...args) {
        return intrusive_ptr_t<Actor>(new Actor(*this, std::forward<Args>(args)...));
    }

    /** \brief the worker threads `io_context` */
    inline asio::io_context &get_io_context() noexcept { return io_context; }

    /** \brief address registry */
    inline registry_t &get_registry() noexcept { return *registry; }

    /** \brief message bus */
    inline bus_t &get_bus() noexcept { return *bus; }

    /** \brief message router */
    inline router_t &get_router() noexcept { return *router; }

    /** \brief runtime settings */
    inline const system_config_t &get_config() const noexcept { return config; }

    /** \brief fatal error handler
     *
     * The default implementation logs the error at the critical level.
     *
     */
    virtual void on_error(const extended_error_ptr_t &ec) noexcept;

  private:
    void run_worker() noexcept;

    system_config_t config;
    asio::io_context io_context;
    std::unique_ptr<guard_t> guard;
    std::vector<std::thread> workers;
    registry_ptr_t registry;
    bus_ptr_t bus;
    router_ptr_t router;
    logger_t log;
    std::mutex lifecycle_mutex;
    std::atomic_bool started{false};
    std::atomic_bool shutdown_flag{false};
};

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
