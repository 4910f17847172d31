//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/registry.h"
#include "stator/error_code.h"
#include <algorithm>
#include <mutex>
#include <random>

using namespace stator;

namespace {

std::size_t random_index(std::size_t size) noexcept {
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> distribution(0, size - 1);
    return distribution(generator);
}

} // namespace

registry_t::registry_t(std::size_t shards_count) noexcept : log{get_logger("stator.registry")} {
    shards_count = std::max<std::size_t>(shards_count, 1);
    shards.reserve(shards_count);
    for (std::size_t i = 0; i < shards_count; ++i) {
        shards.emplace_back(new shard_t());
    }
}

auto registry_t::shard_for(std::size_t routing_key) const noexcept -> shard_t & {
    return *shards[routing_key % shards.size()];
}

extended_error_ptr_t registry_t::register_mailbox(const address_t &address, mailbox_ptr_t mailbox) noexcept {
    if (!mailbox) {
        return make_error(address.to_string(), error_code_t::registry_internal);
    }
    if (address.is_pool()) {
        return make_error(address.to_string(), error_code_t::route_misconfigured);
    }
    auto key = address.routing_key();
    auto &shard = shard_for(key);
    bool inserted = false;
    {
        std::unique_lock lock(shard.mutex);
        auto it = shard.entries.find(address);
        if (it != shard.entries.end()) {
            it->second.mailbox = std::move(mailbox);
        } else {
            shard.entries.emplace(address, entry_t{std::move(mailbox), key});
            shard.keys.insert_or_assign(key, address);
            inserted = true;
            if (address.get_kind() == address_t::kind_t::pool_member) {
                join_pool(address);
            }
        }
    }
    LOG_DEBUG(log, "{} has been {}", address.to_string(), inserted ? "registered" : "re-registered");
    return {};
}

extended_error_ptr_t registry_t::unregister(const address_t &address, const mailbox_t *expected) noexcept {
    auto key = address.routing_key();
    auto &shard = shard_for(key);
    {
        std::unique_lock lock(shard.mutex);
        auto it = shard.entries.find(address);
        if (it == shard.entries.end() || (expected && it->second.mailbox.get() != expected)) {
            return make_error(address.to_string(), error_code_t::address_not_found);
        }
        shard.entries.erase(it);
        auto it_key = shard.keys.find(key);
        if (it_key != shard.keys.end() && it_key->second == address) {
            shard.keys.erase(it_key);
        }
        if (address.get_kind() == address_t::kind_t::pool_member) {
            leave_pool(address);
        }
    }
    LOG_DEBUG(log, "{} has been unregistered", address.to_string());
    return {};
}

extended_error_ptr_t registry_t::resolve(const address_t &address, mailbox_ptr_t &mailbox) const noexcept {
    auto &shard = shard_for(address.routing_key());
    std::shared_lock lock(shard.mutex);
    auto it = shard.entries.find(address);
    if (it == shard.entries.end()) {
        return make_error(address.to_string(), error_code_t::address_not_found);
    }
    mailbox = it->second.mailbox;
    return {};
}

mailbox_ptr_t registry_t::resolve(std::size_t routing_key) const noexcept {
    auto &shard = shard_for(routing_key);
    std::shared_lock lock(shard.mutex);
    auto it_key = shard.keys.find(routing_key);
    if (it_key == shard.keys.end()) {
        return {};
    }
    auto it = shard.entries.find(it_key->second);
    if (it == shard.entries.end()) {
        return {};
    }
    return it->second.mailbox;
}

void registry_t::join_pool(const address_t &address) noexcept {
    std::unique_lock lock(pools_mutex);
    auto &pool = pools[address.get_pool()];
    pool.members.push_back(address);
}

void registry_t::leave_pool(const address_t &address) noexcept {
    std::unique_lock lock(pools_mutex);
    auto it = pools.find(address.get_pool());
    if (it == pools.end()) {
        return;
    }
    auto &members = it->second.members;
    members.erase(std::remove(members.begin(), members.end(), address), members.end());
    if (members.empty()) {
        pools.erase(it);
    }
}

std::optional<address_t> registry_t::pool_member(const std::string &pool_name, pool_strategy_t strategy) noexcept {
    std::shared_lock lock(pools_mutex);
    auto it = pools.find(pool_name);
    if (it == pools.end() || it->second.members.empty()) {
        return {};
    }
    auto &pool = it->second;
    auto size = pool.members.size();
    std::size_t index = 0;
    switch (strategy) {
    case pool_strategy_t::round_robin:
        index = pool.cursor.fetch_add(1, std::memory_order_relaxed) % size;
        break;
    case pool_strategy_t::random:
        index = random_index(size);
        break;
    }
    return pool.members[index];
}

std::size_t registry_t::size() const noexcept {
    std::size_t r = 0;
    for (auto &shard : shards) {
        std::shared_lock lock(shard->mutex);
        r += shard->entries.size();
    }
    return r;
}

std::size_t registry_t::pool_size(const std::string &pool_name) const noexcept {
    std::shared_lock lock(pools_mutex);
    auto it = pools.find(pool_name);
    return it != pools.end() ? it->second.members.size() : 0;
}

std::size_t registry_t::pool_count() const noexcept {
    std::shared_lock lock(pools_mutex);
    return pools.size();
}
