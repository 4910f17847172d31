#pragma once

//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "address.hpp"
#include "mailbox.h"
#include "log.h"
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace stator {

/** \struct registry_t
 *  \brief keeps address-to-mailbox mapping at runtime
 *
 *  The class solves the following problem: the router needs to know
 *  where a message should be put, i.e. the mailbox of the recipient.
 *  Instead of tightly couple actors, the actor registers it's mailbox
 *  under the address on startup, and unregisters it on shutdown.
 *
 *  The registry is shared between many concurrent readers (router,
 *  supervisors, pools selection) and occasional writers. The map is
 *  split into shards, each one is guarded by reader/writer lock, so
 *  that resolves never block each other, and registrations lock only
 *  single shard.
 *
 *  Pool members (see `address_t::pool_member`) are additionally tracked
 *  in the pool, so the router is able to pick up a member of the pool
 *  via round-robin or random selection.
 *
 */
struct STATOR_API registry_t : arc_base_t<registry_t> {
    /** \brief constructs registry with the given amount of shards */
    registry_t(std::size_t shards = 16) noexcept;

    registry_t(const registry_t &) = delete;
    registry_t(registry_t &&) = delete;

    /** \brief registers (or replaces) the mailbox for the address */
    extended_error_ptr_t register_mailbox(const address_t &address, mailbox_ptr_t mailbox) noexcept;

    /** \brief removes address, its routing key and pool membership
     *
     * `address_not_found` error is returned if there is no such address,
     * or if the `expected` mailbox is specified, and the address has been
     * re-registered with another mailbox.
     */
    extended_error_ptr_t unregister(const address_t &address, const mailbox_t *expected = nullptr) noexcept;

    /** \brief resolves mailbox by the address
     *
     * The `mailbox` is set on success, otherwise `address_not_found` error is returned.
     */
    extended_error_ptr_t resolve(const address_t &address, mailbox_ptr_t &mailbox) const noexcept;

    /** \brief resolves mailbox by the precomputed routing key, null is returned if not found */
    mailbox_ptr_t resolve(std::size_t routing_key) const noexcept;

    /** \brief selects a member of the pool, empty optional is returned for unknown or empty pool */
    std::optional<address_t> pool_member(const std::string &pool, pool_strategy_t strategy) noexcept;

    /** \brief total amount of registered addresses */
    std::size_t size() const noexcept;

    /** \brief amount of members of the pool */
    std::size_t pool_size(const std::string &pool) const noexcept;

    /** \brief amount of known (non-empty) pools */
    std::size_t pool_count() const noexcept;

    /** \brief generic non-public fields accessor */
    template <typename T> auto &access() noexcept;

  private:
    struct entry_t {
        mailbox_ptr_t mailbox;
        std::size_t routing_key;
    };

    struct shard_t {
        mutable std::shared_mutex mutex;
        std::unordered_map<address_t, entry_t> entries;
        std::unordered_map<std::size_t, address_t> keys;
    };

    struct pool_t {
        std::vector<address_t> members;
        std::atomic<std::size_t> cursor{0};
    };

    using shard_ptr_t = std::unique_ptr<shard_t>;
    using shards_t = std::vector<shard_ptr_t>;
    using pools_t = std::unordered_map<std::string, pool_t>;

    shard_t &shard_for(std::size_t routing_key) const noexcept;
    void join_pool(const address_t &address) noexcept;
    void leave_pool(const address_t &address) noexcept;

    shards_t shards;
    mutable std::shared_mutex pools_mutex;
    pools_t pools;
    logger_t log;
};

/** \brief intrusive pointer for registry */
using registry_ptr_t = intrusive_ptr_t<registry_t>;

} // namespace stator

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
