#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "arc.hpp"
#include "address.hpp"
#include <typeindex>
#include <deque>
#include <optional>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \brief message priority tag */
enum class priority_t { low = 0, normal, high, critical };

/** \struct envelope_t
 *  \brief Base class for `stator` message envelope.
 *
 *  The base class contains routing information (recipient, sender,
 *  reply address, correlation id) and possibility to detect final
 *  payload type at runtime.
 *
 *  The actual message payload meant to be provided by derived classes,
 *  see {@link message_t}.
 *
 */
struct STATOR_API envelope_t : public arc_base_t<envelope_t> {
    virtual ~envelope_t() = default;

    /**
     * \brief unique message type pointer.
     *
     * The unique message type pointer is used to runtime check payload type
     * before unwrapping the payload.
     *
     */
    const void *type_index;

    /** \brief message destination address */
    std::optional<address_t> recipient;

    /** \brief message originator address */
    std::optional<address_t> sender;

    /** \brief where the reply (if any) should be sent */
    std::optional<address_t> reply_to;

    /** \brief links request envelope with its reply envelope */
    std::optional<correlation_id_t> correlation_id;

    /** \brief max message age, after which it will not be delivered */
    std::optional<pt::time_duration> ttl;

    /** \brief message priority */
    priority_t priority = priority_t::normal;

    /** \brief message creation time (UTC) */
    pt::ptime timestamp;

    /** \brief marks envelope as a reply for some previous request */
    bool reply = false;

    /** \brief sets message sender */
    envelope_t &from(const address_t &address) noexcept;

    /** \brief sets reply address */
    envelope_t &reply_address(const address_t &address) noexcept;

    /** \brief sets message time to live */
    envelope_t &time_to_live(const pt::time_duration &value) noexcept;

    /** \brief sets message priority */
    envelope_t &with_priority(priority_t value) noexcept;

    /** \brief returns `true` if the message TTL has been elapsed */
    bool is_expired(const pt::ptime &now) const noexcept;

    /** \brief returns `true` if the message TTL has been elapsed up to now */
    bool is_expired() const noexcept;

    /** \brief returns address, where the reply for this envelope should be delivered */
    std::optional<address_t> reply_destination() const noexcept;

    /** \brief returns pointer to the payload, if the payload type matches, otherwise `nullptr` */
    template <typename T> const T *payload_cast() const noexcept;

  protected:
    /** \brief constructor which takes payload type and destination address */
    envelope_t(const void *type_index_, std::optional<address_t> recipient_) noexcept;
};

namespace payload_support {
STATOR_API const void *register_type(const std::type_index &type_index) noexcept;
}

/** \struct message_t
 *  \brief the generic envelope meant to hold user-specific payload
 *  \tparam T payload type
 *
 *  The payload is immutable, once the message has been constructed.
 */
template <typename T> struct message_t : public envelope_t {

    /** \brief alias for payload type */
    using payload_t = T;

    /** \brief forwards `args` for payload construction */
    template <typename... Args>
    message_t(std::optional<address_t> recipient_, Args &&...args)
        : envelope_t{message_type, std::move(recipient_)}, payload{std::forward<Args>(args)...} {}

    /** \brief user-defined payload */
    const T payload;

    /** \brief unique per-message-type pointer used for type checks */
    static const void *message_type;
};

template <typename T>
const void *message_t<T>::message_type = payload_support::register_type(typeid(message_t<T>));

template <typename T> const T *envelope_t::payload_cast() const noexcept {
    if (type_index != message_t<T>::message_type) {
        return nullptr;
    }
    return &static_cast<const message_t<T> *>(this)->payload;
}

/** \brief structure to hold envelopes (intrusive pointers) */
using envelopes_queue_t = std::deque<envelope_ptr_t>;

/** \brief constructs envelope by constructing it's payload; intrusive pointer for the envelope is returned */
template <typename T, typename... Args>
auto make_envelope(const address_t &recipient, Args &&...args) -> envelope_ptr_t {
    return envelope_ptr_t{new message_t<T>(recipient, std::forward<Args>(args)...)};
}

/** \brief constructs envelope without recipient
 *
 * Such envelope cannot be published, unless recipient is set later.
 */
template <typename T, typename... Args> auto make_unaddressed(Args &&...args) -> envelope_ptr_t {
    return envelope_ptr_t{new message_t<T>(std::nullopt, std::forward<Args>(args)...)};
}

/** \brief constructs reply envelope for the original request
 *
 * The reply inherits correlation id of the request, and it is addressed
 * to the request reply destination.
 */
template <typename T, typename... Args> auto make_reply(const envelope_t &request, Args &&...args) -> envelope_ptr_t {
    auto reply = envelope_ptr_t{new message_t<T>(request.reply_destination(), std::forward<Args>(args)...)};
    reply->correlation_id = request.correlation_id;
    reply->sender = request.recipient;
    reply->reply = true;
    return reply;
}

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
