#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "envelope.h"
#include "policy.h"
#include "extended_error.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \brief returns effective backpressure reaction for the message priority */
STATOR_API backpressure_t backpressure_for(priority_t priority) noexcept;

/** \struct mailbox_t
 *  \brief thread-safe FIFO queue of envelopes
 *
 * The mailbox is the only way to deliver a message to an actor. Messages
 * are received in the same order as they have been sent.
 *
 * The mailbox might be bounded (`capacity > 0`); then the backpressure
 * reaction is applied, when there is no space for a new message.
 *
 * The optional listener is invoked (outside of the mailbox lock) each
 * time a new message has been put into the mailbox; it is used to
 * schedule message processing on the consumer side.
 *
 * The same type is used for bus subscriptions streams, see {@link bus_t}.
 *
 */
struct STATOR_API mailbox_t : arc_base_t<mailbox_t> {
    /** \brief new message notification callback */
    using listener_t = std::function<void()>;

    /** \brief constructs mailbox, `0` capacity means unbounded */
    mailbox_t(std::size_t capacity = 0, backpressure_t backpressure = backpressure_t::error) noexcept;

    mailbox_t(const mailbox_t &) = delete;
    mailbox_t(mailbox_t &&) = delete;

    /** \brief puts the envelope into the mailbox
     *
     * If the mailbox is full, the backpressure is applied. For the
     * blocking reaction the sender waits at most `timeout`, and then
     * gets `send_timeout` error.
     *
     * `mailbox_closed` error is returned for closed mailbox.
     *
     */
    extended_error_ptr_t send(envelope_ptr_t envelope, const pt::time_duration &timeout = pt::pos_infin) noexcept;

    /** \brief returns the next message without waiting or null */
    envelope_ptr_t try_receive() noexcept;

    /** \brief waits at most `timeout` for the next message, null is returned on timeout or close */
    envelope_ptr_t receive(const pt::time_duration &timeout) noexcept;

    /** \brief closes the mailbox; pending messages still can be received */
    void close() noexcept;

    /** \brief whether the mailbox has been closed */
    bool is_closed() const noexcept;

    /** \brief amount of pending messages */
    std::size_t size() const noexcept;

    /** \brief max amount of pending messages, `0` for unbounded mailbox */
    inline std::size_t get_capacity() const noexcept { return capacity; }

    /** \brief amount of successfully enqueued messages */
    inline std::uint64_t get_received() const noexcept { return received.load(std::memory_order_relaxed); }

    /** \brief amount of dropped due to backpressure messages */
    inline std::uint64_t get_dropped() const noexcept { return dropped.load(std::memory_order_relaxed); }

    /** \brief installs new message listener */
    void set_listener(listener_t listener) noexcept;

  private:
    using lock_t = std::unique_lock<std::mutex>;

    bool has_space() const noexcept;

    std::size_t capacity;
    backpressure_t backpressure;
    mutable std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    envelopes_queue_t queue;
    listener_t listener;
    bool closed = false;
    std::atomic<std::uint64_t> received{0};
    std::atomic<std::uint64_t> dropped{0};
};

/** \brief subscription stream is just unbounded mailbox */
using stream_t = mailbox_t;

/** \brief intrusive pointer for subscription stream */
using stream_ptr_t = intrusive_ptr_t<stream_t>;

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
