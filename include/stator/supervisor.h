#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "child.h"
#include "events.h"
#include "health_monitor.h"
#include "log.h"
#include "supervisor_config.h"
#include "detail/timed_call.h"
#include <boost/asio/deadline_timer.hpp>
#include <boost/functional/hash.hpp>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \struct child_status_t
 *  \brief the point-in-time view on the supervised child
 */
struct child_status_t {
    /** \brief child id */
    child_id_t id;

    /** \brief child name from the descriptor */
    std::string name;

    /** \brief lifecycle state */
    child_state_t state;

    /** \brief total amount of restarts */
    std::uint32_t restart_count;

    /** \brief the last health check result */
    health_t health;

    /** \brief when the current instance has been started */
    std::optional<pt::ptime> start_time;

    /** \brief when the child has been restarted last time */
    std::optional<pt::ptime> last_restart;
};

/** \struct supervisor_t
 *  \brief supervisor owns children, restarts them on failure, and shuts them down
 *
 * The supervisor keeps the children in the start order. When a child
 * fails, the supervision strategy decides which children should be
 * restarted; the restart budget and the delay before restart are
 * controlled by the per-child backoff. The child, which exhausted its
 * budget, becomes permanently failed; that is not fatal for the
 * supervisor itself, unless `escalate_failure` is configured: then the
 * supervisor reports its own failure to the parent.
 *
 * The supervisor is a child too, so it can be supervised by another
 * supervisor. Its restart means stopping all of its children and
 * starting them again from their descriptors.
 *
 * All operations are thread-safe and synchronous, except the delayed
 * restarts: when the backoff demands a delay, the affected children
 * are left in the `restarting` state and respawned later by the timer
 * on the worker threads, without holding the supervisor. The children
 * termination reports are posted onto the worker threads and funnelled
 * into the same operations.
 *
 */
struct STATOR_API supervisor_t : child_t {
    /** \brief supervisor lifecycle state */
    enum class state_t { running, shutting_down, stopped };

    /** \brief injects an alias for supervisor_config_t */
    using config_t = supervisor_config_t;

    supervisor_t(system_context_t &system_context, const supervisor_config_t &config) noexcept;
    ~supervisor_t();

    /** \brief creates, starts and inserts the child
     *
     * The `id` is set upon successful start.
     */
    extended_error_ptr_t start_child(const child_descriptor_t &descriptor, child_id_t &id) noexcept;

    /** \brief stops the child in accordance with its shutdown policy and forgets it */
    extended_error_ptr_t stop_child(const child_id_t &id) noexcept;

    /** \brief manually restarts the child; the restart budget is respected */
    extended_error_ptr_t restart_child(const child_id_t &id) noexcept;

    /** \brief abnormal child termination: the strategy is applied */
    extended_error_ptr_t handle_child_failure(const child_id_t &id, const extended_error_ptr_t &reason) noexcept;

    /** \brief normal child termination: the restart policy is applied */
    extended_error_ptr_t handle_child_exit(const child_id_t &id) noexcept;

    /** \brief stops all children in the reverse start order and forgets them */
    extended_error_ptr_t shutdown() noexcept;

    /** \brief checks all running children health once */
    extended_error_ptr_t check_health() noexcept;

    /** \brief checks the child health once */
    extended_error_ptr_t check_child_health(const child_id_t &id, health_t &health) noexcept;

    /** \brief per-child status, in the start order */
    std::vector<child_status_t> health_snapshot() const noexcept;

    /** \brief amount of supervised children */
    std::size_t child_count() const noexcept;

    /** \brief supervised children ids in the start order */
    std::vector<child_id_t> child_ids() const noexcept;

    /** \brief supervisor state */
    state_t get_state() const noexcept;

    /** \brief unique supervisor id */
    inline const supervisor_id_t &get_id() const noexcept { return id; }

    /** \brief human-readable supervisor name */
    inline const std::string &get_identity() const noexcept { return config.identity; }

    /** \brief supervisor settings */
    inline const supervisor_config_t &get_config() const noexcept { return config; }

    /** \brief system context */
    inline system_context_t &get_system_context() noexcept { return system_context; }

    extended_error_ptr_t start() noexcept override;
    extended_error_ptr_t stop(const pt::time_duration &timeout) noexcept override;
    void terminate() noexcept override;
    health_t health_check() noexcept override;

    /** \brief generic non-public fields accessor */
    template <typename T> auto &access() noexcept;

  private:
    struct entry_t {
        child_descriptor_t descriptor;
        child_handle_t handle;
        backoff_t backoff;
        health_t health;
        std::uint32_t health_failures = 0;
        std::uint64_t restart_ticket = 0;
        detail::call_tracker_ptr_t calls;
    };

    using entries_t = std::unordered_map<child_id_t, entry_t, boost::hash<child_id_t>>;
    using ids_t = std::vector<child_id_t>;
    using lock_t = std::unique_lock<std::mutex>;
    using timer_ptr_t = std::unique_ptr<asio::deadline_timer>;
    using timers_t = std::unordered_map<std::uint64_t, timer_ptr_t>;

    void on_report(const child_id_t &id, std::uint64_t generation, const extended_error_ptr_t &reason) noexcept;
    void on_restart_timer(std::uint64_t ticket, const ids_t &ids, const boost::system::error_code &ec) noexcept;
    extended_error_ptr_t do_terminated(const child_id_t &id, const extended_error_ptr_t &reason,
                                       bool abnormal) noexcept;
    extended_error_ptr_t do_recover(const child_id_t &failed_id, const extended_error_ptr_t &reason) noexcept;
    extended_error_ptr_t give_up(const child_id_t &id, entry_t &entry, const extended_error_ptr_t &reason) noexcept;
    extended_error_ptr_t revive(const child_id_t &id, entry_t &entry) noexcept;
    extended_error_ptr_t respawn(const ids_t &ids) noexcept;
    void schedule_restart(const ids_t &ids, const pt::time_duration &delay) noexcept;
    void cancel_restarts() noexcept;
    extended_error_ptr_t do_stop_children(bool forget) noexcept;
    extended_error_ptr_t do_check(const child_id_t &id, health_t &health) noexcept;
    extended_error_ptr_t spawn(entry_t &entry) noexcept;
    extended_error_ptr_t halt(entry_t &entry) noexcept;
    void forget(const child_id_t &id) noexcept;
    void start_health_monitor() noexcept;
    void stop_health_monitor() noexcept;
    void emit(supervision_event_kind_t kind, const child_id_t *child_id, metadata_t metadata = {}) noexcept;

    system_context_t &system_context;
    supervisor_config_t config;
    supervisor_id_t id;
    logger_t log;

    mutable std::mutex mutex;
    state_t state = state_t::running;
    entries_t entries;
    ids_t order;
    report_channel_ptr_t channel;
    std::uint64_t generations = 0;
    std::uint64_t restart_tickets = 0;
    timers_t timers;

    std::mutex health_mutex;
    health_monitor_ptr_t health_monitor;
};

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
