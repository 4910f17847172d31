#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "mailbox.h"
#include "monitor.h"
#include "error_code.h"
#include "log.h"
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <boost/functional/hash.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

namespace asio = boost::asio;

/** \struct bus_t
 *  \brief publish/subscribe transport with request-reply correlation
 *
 * Every published envelope is broadcasted to all subscription streams;
 * the bus itself does not know how to deliver a message to the concrete
 * actor, that is the job of {@link router_t}, which is one of the
 * subscribers.
 *
 * The subscribers list is copy-on-write: publishers take the current
 * snapshot without locking, (un)subscriptions replace the snapshot.
 * Closed streams are pruned lazily on publish.
 *
 * The request is an envelope with correlation id, for which the pending
 * request record is created. A reply (envelope with the `reply` flag and
 * the same correlation id) completes the pending request instead of being
 * broadcasted. The pending request is resolved exactly once: either by
 * the reply or by timeout; replies which came after that are discarded.
 *
 */
struct STATOR_API bus_t : arc_base_t<bus_t> {
    /** \brief reply handler; it is invoked with null envelope on timeout */
    using reply_handler_t = std::function<void(envelope_ptr_t)>;

    /** \brief constructs bus, which uses the `io_context` for request timers */
    bus_t(asio::io_context &io_context, bus_monitor_ptr_t monitor = {}) noexcept;

    bus_t(const bus_t &) = delete;
    bus_t(bus_t &&) = delete;

    ~bus_t();

    /** \brief creates new independent stream of all published envelopes */
    stream_ptr_t subscribe() noexcept;

    /** \brief removes stream from subscribers and closes it */
    void unsubscribe(const stream_ptr_t &stream) noexcept;

    /** \brief broadcasts the envelope to all subscribers
     *
     * The envelope without recipient is `route_misconfigured` error; the
     * only exception is reply envelope, which completes pending request.
     *
     */
    extended_error_ptr_t publish(envelope_ptr_t envelope) noexcept;

    /** \brief publishes the request and returns immediately
     *
     * The new correlation id is assigned to the envelope. The `handler` is
     * invoked exactly once: with the reply envelope, or with null envelope
     * when the `timeout` elapses. The handler is invoked either from the
     * replying thread or from the `io_context` thread.
     *
     * If publishing fails, the pending request is removed, the error is
     * returned and the handler is not invoked.
     *
     */
    extended_error_ptr_t async_request(envelope_ptr_t envelope, const pt::time_duration &timeout,
                                       reply_handler_t handler) noexcept;

    /** \brief publishes the request and waits the reply at most `timeout`
     *
     * The `reply` is set to null on timeout: that's normal outcome, not
     * an error. The pending request is always removed upon return.
     *
     * The method blocks the calling thread. Actors must not call it from
     * `on_message()`: the reply is processed by the same worker threads, so
     * on a single worker the request can only time out. Actors use
     * `async_request` instead.
     */
    extended_error_ptr_t publish_request(envelope_ptr_t envelope, const pt::time_duration &timeout,
                                         envelope_ptr_t &reply) noexcept;

    /** \brief constructs reply envelope for the request and publishes it */
    template <typename T, typename... Args> extended_error_ptr_t reply(const envelope_t &request, Args &&...args) {
        return publish(make_reply<T>(request, std::forward<Args>(args)...));
    }

    /** \brief completes all pending requests with null reply */
    void cancel_requests() noexcept;

    /** \brief amount of pending (unresolved) requests */
    std::size_t pending_requests() const noexcept;

    /** \brief amount of current subscribers */
    std::size_t subscribers_count() const noexcept;

    /** \brief records bus event into the monitor */
    void emit(bus_event_kind_t kind, const std::optional<address_t> &address,
              const std::optional<correlation_id_t> &correlation_id, const extended_error_ptr_t &error = {}) noexcept;

    /** \brief generic non-public fields accessor */
    template <typename T> auto &access() noexcept;

  private:
    using timer_t = asio::deadline_timer;
    using timer_ptr_t = std::unique_ptr<timer_t>;
    using streams_t = std::vector<stream_ptr_t>;
    using streams_ptr_t = std::shared_ptr<const streams_t>;

    struct pending_t {
        reply_handler_t handler;
        pt::ptime created;
        pt::ptime deadline;
        timer_ptr_t timer;
    };
    using pending_map_t = std::unordered_map<correlation_id_t, pending_t, boost::hash<correlation_id_t>>;

    void add_pending(const correlation_id_t &id, pending_t &&pending) noexcept;
    bool take_pending(const correlation_id_t &id, pending_t &pending) noexcept;
    void on_timeout(const correlation_id_t &id) noexcept;
    void prune() noexcept;

    asio::io_context &io_context;
    bus_monitor_ptr_t monitor;
    logger_t log;

    std::mutex subscribers_mutex;
    streams_ptr_t subscribers;

    mutable std::mutex pending_mutex;
    pending_map_t pending;
};

/** \brief intrusive pointer for bus */
using bus_ptr_t = intrusive_ptr_t<bus_t>;

/** \brief extracts typed payload from the reply
 *
 * The `request_timeout` error is returned for the null reply (i.e. timed
 * out request), the `payload_type_mismatch` for the unexpected reply type.
 */
template <typename T> extended_error_ptr_t reply_as(const envelope_ptr_t &reply, const T *&payload) noexcept {
    payload = nullptr;
    if (!reply) {
        return make_error("reply", error_code_t::request_timeout);
    }
    payload = reply->payload_cast<T>();
    if (!payload) {
        return make_error("reply", error_code_t::payload_type_mismatch);
    }
    return {};
}

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
