#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "bus.h"
#include "registry.h"
#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \struct dead_letter_t
 *  \brief the envelope, which cannot be delivered, and the reason
 */
struct dead_letter_t {
    /** \brief undelivered envelope */
    envelope_ptr_t envelope;

    /** \brief why the envelope has not been delivered */
    extended_error_ptr_t reason;

    /** \brief when the delivery has been given up (UTC) */
    pt::ptime timestamp;
};

/** \struct dead_letters_t
 *  \brief bounded queue of undeliverable envelopes
 *
 * When the queue is full, the oldest dead letter is evicted.
 *
 */
struct STATOR_API dead_letters_t {
    /** \brief alias for the list of dead letters */
    using letters_t = std::vector<dead_letter_t>;

    /** \brief constructs queue, which keeps at most `capacity` letters */
    dead_letters_t(std::size_t capacity) noexcept;

    /** \brief appends dead letter, evicting the oldest one if needed */
    void push(dead_letter_t letter) noexcept;

    /** \brief takes all accumulated dead letters */
    letters_t drain() noexcept;

    /** \brief amount of currently kept dead letters */
    std::size_t size() const noexcept;

    /** \brief total amount of dead letters ever pushed */
    inline std::uint64_t get_total() const noexcept { return total.load(std::memory_order_relaxed); }

    /** \brief max amount of kept dead letters */
    inline std::size_t get_capacity() const noexcept { return capacity; }

  private:
    std::size_t capacity;
    mutable std::mutex mutex;
    std::deque<dead_letter_t> letters;
    std::atomic<std::uint64_t> total{0};
};

/** \struct router_config_t
 *  \brief router delivery settings
 */
struct router_config_t {
    /** \brief max time to wait on the full (blocking) mailbox */
    pt::time_duration send_timeout = pt::millisec{100};

    /** \brief how to pick up the member of the pool for pool-addressed envelopes */
    pool_strategy_t pool_strategy = pool_strategy_t::round_robin;

    /** \brief dead letters queue capacity */
    std::size_t dead_letters_capacity = 1024;
};

/** \struct router_t
 *  \brief delivers published envelopes into recipients mailboxes
 *
 * The router is the bus subscriber, which for each envelope resolves
 * the recipient address via the registry, and puts the envelope into
 * the recipient mailbox.
 *
 * Envelopes are processed sequentially on the router strand, so the
 * order of delivery for the same recipient is the same as the order of
 * publishing.
 *
 * The delivery failures (unknown recipient, closed or full mailbox,
 * send timeout, expired TTL) never stop the router: the failure is
 * logged, recorded as bus event, and the envelope is put into the
 * dead letters queue.
 *
 */
struct STATOR_API router_t : arc_base_t<router_t> {
    /** \brief constructs router; it does not process anything until `start()` */
    router_t(asio::io_context &io_context, registry_ptr_t registry, bus_ptr_t bus,
             const router_config_t &config = {}) noexcept;

    router_t(const router_t &) = delete;
    router_t(router_t &&) = delete;

    /** \brief subscribes to the bus and starts delivery */
    void start() noexcept;

    /** \brief stops accepting new envelopes and unsubscribes from the bus
     *
     * The envelope, which is being delivered at the moment, is delivered.
     */
    void stop() noexcept;

    /** \brief whether the router is accepting envelopes */
    inline bool is_running() const noexcept { return running.load(std::memory_order_acquire); }

    /** \brief delivers single envelope synchronously */
    extended_error_ptr_t deliver(const envelope_ptr_t &envelope) noexcept;

    /** \brief undeliverable envelopes */
    inline dead_letters_t &get_dead_letters() noexcept { return dead_letters; }

    /** \brief amount of successfully delivered envelopes */
    inline std::uint64_t get_delivered() const noexcept { return delivered.load(std::memory_order_relaxed); }

  private:
    void schedule() noexcept;
    void process() noexcept;
    void give_up(const envelope_ptr_t &envelope, bus_event_kind_t kind, const extended_error_ptr_t &reason) noexcept;

    asio::io_context::strand strand;
    registry_ptr_t registry;
    bus_ptr_t bus;
    router_config_t config;
    logger_t log;
    stream_ptr_t stream;
    dead_letters_t dead_letters;
    std::atomic_bool running{false};
    std::atomic_bool scheduled{false};
    std::atomic<std::uint64_t> delivered{0};
};

/** \brief intrusive pointer for router */
using router_ptr_t = intrusive_ptr_t<router_t>;

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
