#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "forward.hpp"
#include "stator/export.h"
#include <string>
#include <ostream>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \brief generates new random UUID (thread-safe) */
STATOR_API boost::uuids::uuid make_uuid() noexcept;

/** \struct address_t
 *  \brief Message delivery point
 *
 * Address is an abstraction of "point of service", i.e. any actor can send
 * a message to an address, and the router delivers it into the mailbox,
 * registered for the address in the {@link registry_t}.
 *
 * There are few kinds of addresses:
 *  - named, the stable human-readable name, the equality is defined by name only;
 *  - anonymous, which is identified by the generated UUID;
 *  - pool member, i.e. the named member of the named pool; the registry tracks
 *    pool membership for such addresses;
 *  - pool, which is a reference to any member of the pool; it is resolved
 *    into concrete pool member upon delivery.
 *
 * The address is immutable value: it can be freely copied between threads.
 *
 */
struct STATOR_API address_t {
    /** \brief address kind */
    enum class kind_t { named, anonymous, pool_member, pool };

    /** \brief creates address with stable name */
    static address_t named(const std::string &name) noexcept;

    /** \brief creates address with generated unique id */
    static address_t anonymous() noexcept;

    /** \brief creates address of the named member of the pool */
    static address_t pool_member(const std::string &pool, const std::string &member) noexcept;

    /** \brief creates a reference to any member of the pool */
    static address_t pool(const std::string &pool) noexcept;

    /** \brief returns address kind */
    inline kind_t get_kind() const noexcept { return kind; }

    /** \brief returns address name (member name for pool members, empty for anonymous) */
    inline const std::string &get_name() const noexcept { return name; }

    /** \brief returns pool name (empty for non-pool addresses) */
    inline const std::string &get_pool() const noexcept { return pool_name; }

    /** \brief returns generated id (nil for non-anonymous addresses) */
    inline const boost::uuids::uuid &get_id() const noexcept { return id; }

    /** \brief whether the address should be resolved via pool selection */
    inline bool is_pool() const noexcept { return kind == kind_t::pool; }

    /** \brief precomputed routing key (hash) of the address */
    inline std::size_t routing_key() const noexcept { return key; }

    /** \brief human-readable address representation */
    std::string to_string() const noexcept;

    inline bool operator==(const address_t &other) const noexcept {
        return key == other.key && kind == other.kind && name == other.name && pool_name == other.pool_name &&
               id == other.id;
    }

    inline bool operator!=(const address_t &other) const noexcept { return !(*this == other); }

  private:
    address_t(kind_t kind_, std::string name_, std::string pool_, const boost::uuids::uuid &id_) noexcept;

    kind_t kind;
    std::string name;
    std::string pool_name;
    boost::uuids::uuid id;
    std::size_t key;
};

STATOR_API std::ostream &operator<<(std::ostream &out, const address_t &address);

} // namespace stator

namespace std {
/** \struct hash<stator::address_t>
 *  \brief Hash calculator for address
 */
template <> struct hash<stator::address_t> {
    /** \brief returns precalculated address hash */
    inline size_t operator()(const stator::address_t &address) const noexcept { return address.routing_key(); }
};

} // namespace std

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
