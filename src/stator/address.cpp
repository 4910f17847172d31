//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/address.hpp"
#include <boost/container_hash/hash.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <sstream>

namespace stator {

boost::uuids::uuid make_uuid() noexcept {
    thread_local boost::uuids::random_generator generator;
    return generator();
}

address_t::address_t(kind_t kind_, std::string name_, std::string pool_, const boost::uuids::uuid &id_) noexcept
    : kind{kind_}, name{std::move(name_)}, pool_name{std::move(pool_)}, id{id_} {
    std::size_t seed = static_cast<std::size_t>(kind);
    boost::hash_combine(seed, name);
    boost::hash_combine(seed, pool_name);
    boost::hash_combine(seed, boost::uuids::hash_value(id));
    key = seed;
}

address_t address_t::named(const std::string &name) noexcept {
    return address_t(kind_t::named, name, {}, boost::uuids::uuid{});
}

address_t address_t::anonymous() noexcept { return address_t(kind_t::anonymous, {}, {}, make_uuid()); }

address_t address_t::pool_member(const std::string &pool, const std::string &member) noexcept {
    return address_t(kind_t::pool_member, member, pool, boost::uuids::uuid{});
}

address_t address_t::pool(const std::string &pool) noexcept {
    return address_t(kind_t::pool, {}, pool, boost::uuids::uuid{});
}

std::string address_t::to_string() const noexcept {
    std::stringstream out;
    switch (kind) {
    case kind_t::named:
        out << name;
        break;
    case kind_t::anonymous:
        out << "anonymous@" << id;
        break;
    case kind_t::pool_member:
        out << pool_name << ":" << name;
        break;
    case kind_t::pool:
        out << pool_name << ":*";
        break;
    }
    return out.str();
}

std::ostream &operator<<(std::ostream &out, const address_t &address) { return out << address.to_string(); }

} // namespace stator
