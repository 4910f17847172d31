#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "arc.hpp"
#include "backoff.h"
#include "extended_error.h"
#include "policy.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \brief supervised child lifecycle state */
enum class child_state_t {
    starting,
    running,
    stopping,
    stopped,
    restarting,
    failed,
    /** \brief restart budget has been exhausted, the child will never be restarted */
    permanently_failed,
};

STATOR_API const char *to_string(child_state_t state) noexcept;

/** \brief child health check verdict */
enum class health_status_t { healthy, degraded, failed };

STATOR_API const char *to_string(health_status_t status) noexcept;

/** \struct health_t
 *  \brief child health check result
 */
struct STATOR_API health_t {
    /** \brief the verdict */
    health_status_t status = health_status_t::healthy;

    /** \brief human-readable explanation for degraded or failed verdict */
    std::string reason;

    /** \brief everything is fine */
    static health_t healthy() noexcept { return {}; }

    /** \brief the child works, but something is wrong */
    static health_t degraded(std::string reason) noexcept { return {health_status_t::degraded, std::move(reason)}; }

    /** \brief the child does not work and should be restarted */
    static health_t failed(std::string reason) noexcept { return {health_status_t::failed, std::move(reason)}; }

    inline bool is_healthy() const noexcept { return status == health_status_t::healthy; }
    inline bool is_degraded() const noexcept { return status == health_status_t::degraded; }
    inline bool is_failed() const noexcept { return status == health_status_t::failed; }
};

/** \struct report_channel_t
 *  \brief the way a child notifies its supervisor about termination
 *
 * The channel is owned by the supervisor; children hold only weak
 * pointer to it, so there is no ownership cycle between a supervisor
 * and its children.
 *
 * The report is not processed in the caller context: it is posted
 * via `poster_t` (i.e. onto the worker threads pool), and then the
 * handler is invoked unless the channel has been closed meanwhile.
 *
 */
struct STATOR_API report_channel_t : std::enable_shared_from_this<report_channel_t> {
    /** \brief termination handler; null error means normal exit */
    using handler_t =
        std::function<void(const child_id_t &, std::uint64_t generation, const extended_error_ptr_t &)>;

    /** \brief deferred execution */
    using poster_t = std::function<void(std::function<void()>)>;

    report_channel_t(poster_t poster, handler_t handler) noexcept;

    /** \brief posts termination report */
    void report(const child_id_t &id, std::uint64_t generation, const extended_error_ptr_t &ee) noexcept;

    /** \brief disables the handler; the reports are ignored afterwards */
    void close() noexcept;

  private:
    void dispatch(const child_id_t &id, std::uint64_t generation, const extended_error_ptr_t &ee) noexcept;

    std::mutex mutex;
    poster_t poster;
    handler_t handler;
};

/** \brief shared pointer to the report channel */
using report_channel_ptr_t = std::shared_ptr<report_channel_t>;

/** \struct child_t
 *  \brief the unit of supervision
 *
 * The child is started and stopped by its supervisor. Both operations
 * are bounded in time by the supervisor: if `stop()` does not complete
 * in time, the `terminate()` is invoked to force the child down.
 *
 * The child notifies the supervisor about termination via
 * `report_failure()` (abnormal) or `report_exit()` (normal).
 *
 */
struct STATOR_API child_t : arc_base_t<child_t> {
    virtual ~child_t() = default;

    /** \brief starts the child, the error means start failure */
    virtual extended_error_ptr_t start() noexcept = 0;

    /** \brief gracefully stops the child during the `timeout` */
    virtual extended_error_ptr_t stop(const pt::time_duration &timeout) noexcept = 0;

    /** \brief forced shutdown, after graceful one failed or timed out */
    virtual void terminate() noexcept;

    /** \brief checks the child health */
    virtual health_t health_check() noexcept;

    /** \brief notifies the supervisor about the abnormal termination */
    void report_failure(const extended_error_ptr_t &ee) noexcept;

    /** \brief notifies the supervisor about the normal termination */
    void report_exit() noexcept;

    /** \brief links the child with the supervisor report channel
     *
     * The `generation` identifies the particular spawn of the child, so the
     * supervisor can tell reports of the current instance from the outdated ones.
     */
    void link(const report_channel_ptr_t &channel, const child_id_t &id, std::uint64_t generation) noexcept;

    /** \brief forgets the supervisor */
    void unlink() noexcept;

    /** \brief generic non-public fields accessor */
    template <typename T> auto &access() noexcept;

  private:
    std::mutex link_mutex;
    std::weak_ptr<report_channel_t> channel;
    child_id_t id{};
    std::uint64_t generation = 0;
};

/** \struct child_descriptor_t
 *  \brief the recipe, how to (re)create and manage the child
 *
 * The descriptor is immutable, once it has been passed to the
 * supervisor.
 *
 */
struct STATOR_API child_descriptor_t {
    /** \brief human-readable child name (used in logs and events) */
    std::string name;

    /** \brief creates new child instance on every (re)start */
    factory_t factory;

    /** \brief restart policy */
    restart_policy_t restart_policy = restart_policy_t::permanent;

    /** \brief shutdown policy */
    shutdown_policy_t shutdown_policy = {};

    /** \brief max time for the child start */
    pt::time_duration start_timeout = pt::seconds{5};

    /** \brief max time for the child stop; the effective one is the minimum with policy timeout */
    pt::time_duration shutdown_timeout = pt::seconds{5};

    /** \brief restart limits and delays */
    backoff_config_t backoff = {};

    /** \brief checks that factory is set and timeouts are positive */
    bool validate() const noexcept;

    /** \brief the effective time to wait for the graceful stop */
    pt::time_duration effective_shutdown_timeout() const noexcept;
};

/** \struct child_descriptor_builder_t
 *  \brief fluent child descriptor builder
 */
struct STATOR_API child_descriptor_builder_t {
    /** \brief the currently build descriptor */
    child_descriptor_t descriptor;

    child_descriptor_builder_t(std::string name, factory_t factory) noexcept;

    /** \brief sets restart policy */
    child_descriptor_builder_t &&restart_policy(restart_policy_t value) &&noexcept {
        descriptor.restart_policy = value;
        return std::move(*this);
    }

    /** \brief sets shutdown policy */
    child_descriptor_builder_t &&shutdown_policy(const shutdown_policy_t &value) &&noexcept {
        descriptor.shutdown_policy = value;
        return std::move(*this);
    }

    /** \brief sets both start and shutdown timeouts */
    child_descriptor_builder_t &&timeout(const pt::time_duration &value) &&noexcept {
        descriptor.start_timeout = descriptor.shutdown_timeout = value;
        return std::move(*this);
    }

    /** \brief sets start timeout */
    child_descriptor_builder_t &&start_timeout(const pt::time_duration &value) &&noexcept {
        descriptor.start_timeout = value;
        return std::move(*this);
    }

    /** \brief sets shutdown timeout */
    child_descriptor_builder_t &&shutdown_timeout(const pt::time_duration &value) &&noexcept {
        descriptor.shutdown_timeout = value;
        return std::move(*this);
    }

    /** \brief sets restart limits and delays */
    child_descriptor_builder_t &&backoff(const backoff_config_t &value) &&noexcept {
        descriptor.backoff = value;
        return std::move(*this);
    }

    /** \brief checks whether the descriptor is valid */
    bool validate() const noexcept { return descriptor.validate(); }

    /** \brief returns the built descriptor */
    child_descriptor_t finish() && { return std::move(descriptor); }
};

/** \brief starts building child descriptor */
inline child_descriptor_builder_t describe_child(std::string name, factory_t factory) noexcept {
    return child_descriptor_builder_t(std::move(name), std::move(factory));
}

/** \struct child_handle_t
 *  \brief the supervisor-side state of the child
 */
struct child_handle_t {
    /** \brief generated child id */
    child_id_t id;

    /** \brief current lifecycle state */
    child_state_t state = child_state_t::starting;

    /** \brief spawn counter of the current instance */
    std::uint64_t generation = 0;

    /** \brief running instance (if any) */
    child_ptr_t instance;

    /** \brief total amount of restarts */
    std::uint32_t restart_count = 0;

    /** \brief when the child has been restarted last time */
    std::optional<pt::ptime> last_restart;

    /** \brief when the current instance has been started */
    std::optional<pt::ptime> start_time;
};

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
