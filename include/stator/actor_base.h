#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "child.h"
#include "bus.h"
#include "log.h"
#include <atomic>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \struct actor_base_t
 *  \brief universal primitive of concurrent computation
 *
 * The actor owns the mailbox, which is registered under the actor
 * address in the registry during the start, so the router is able to
 * deliver messages to it. The messages are processed one by one on the
 * actor strand, i.e. the actor is never executed concurrently with
 * itself, but different actors are executed on different worker
 * threads.
 *
 * The actor is a supervised child: when the message handler returns an
 * error, the actor stops processing further messages and reports the
 * failure to its supervisor.
 *
 */
struct STATOR_API actor_base_t : child_t {
    /** \brief constructs actor with the default mailbox of the system context */
    actor_base_t(system_context_t &system_context, const address_t &address) noexcept;

    /** \brief constructs actor with the specified mailbox */
    actor_base_t(system_context_t &system_context, const address_t &address, mailbox_ptr_t mailbox) noexcept;

    /** \brief processes the message; the error means actor failure */
    virtual extended_error_ptr_t on_message(envelope_t &envelope) noexcept = 0;

    /** \brief registers the mailbox and starts messages processing */
    extended_error_ptr_t start() noexcept override;

    /** \brief unregisters and closes the mailbox */
    extended_error_ptr_t stop(const pt::time_duration &timeout) noexcept override;

    void terminate() noexcept override;

    /** \brief publishes the envelope on behalf of the actor */
    extended_error_ptr_t send(envelope_ptr_t envelope) noexcept;

    /** \brief constructs envelope with the payload and publishes it on behalf of the actor */
    template <typename T, typename... Args> extended_error_ptr_t send(const address_t &recipient, Args &&...args) {
        return send(make_envelope<T>(recipient, std::forward<Args>(args)...));
    }

    /** \brief constructs reply for the request and publishes it */
    template <typename T, typename... Args> extended_error_ptr_t reply(const envelope_t &request, Args &&...args) {
        auto envelope = make_reply<T>(request, std::forward<Args>(args)...);
        envelope->sender = address;
        return bus.publish(std::move(envelope));
    }

    /** \brief actor address */
    inline const address_t &get_address() const noexcept { return address; }

    /** \brief actor mailbox */
    inline const mailbox_ptr_t &get_mailbox() const noexcept { return mailbox; }

    /** \brief amount of processed messages */
    inline std::uint64_t get_processed() const noexcept { return processed.load(std::memory_order_relaxed); }

    /** \brief whether the actor processes messages */
    inline bool is_active() const noexcept { return active.load(std::memory_order_acquire); }

  protected:
    /** \brief actor-specific start hook; the error aborts start */
    virtual extended_error_ptr_t on_start() noexcept;

    /** \brief actor-specific stop hook */
    virtual void on_stop() noexcept;

    /** \brief refernce to `system_context_t` */
    system_context_t &system_context;

    /** \brief actor address */
    address_t address;

    /** \brief actor mailbox */
    mailbox_ptr_t mailbox;

    /** \brief the message bus */
    bus_t &bus;

    /** \brief actor logger */
    logger_t log;

  private:
    void schedule() noexcept;
    void process() noexcept;
    void detach() noexcept;

    asio::io_context::strand strand;
    std::atomic_bool active{false};
    std::atomic_bool scheduled{false};
    std::atomic<std::uint64_t> processed{0};
};

/** \brief intrusive pointer for actor */
using actor_ptr_t = intrusive_ptr_t<actor_base_t>;

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
