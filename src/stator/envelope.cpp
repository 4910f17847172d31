//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/envelope.h"
#include <unordered_map>
#include <string_view>

using type_map_t = std::unordered_map<std::string_view, const void *>;

namespace stator {

namespace payload_support {

const void *register_type(const std::type_index &type_index) noexcept {
    static type_map_t type_map = {};

    auto name = std::string_view(type_index.name());
    auto it = type_map.find(name);
    if (it != type_map.end()) {
        return it->second;
    }
    auto ptr = static_cast<const void *>(type_index.name());
    type_map[name] = ptr;
    return ptr;
}

} // namespace payload_support

envelope_t::envelope_t(const void *type_index_, std::optional<address_t> recipient_) noexcept
    : type_index{type_index_}, recipient{std::move(recipient_)}, timestamp{pt::microsec_clock::universal_time()} {}

envelope_t &envelope_t::from(const address_t &address) noexcept {
    sender = address;
    return *this;
}

envelope_t &envelope_t::reply_address(const address_t &address) noexcept {
    reply_to = address;
    return *this;
}

envelope_t &envelope_t::time_to_live(const pt::time_duration &value) noexcept {
    ttl = value;
    return *this;
}

envelope_t &envelope_t::with_priority(priority_t value) noexcept {
    priority = value;
    return *this;
}

bool envelope_t::is_expired(const pt::ptime &now) const noexcept {
    if (!ttl) {
        return false;
    }
    return (now - timestamp) > *ttl;
}

bool envelope_t::is_expired() const noexcept { return is_expired(pt::microsec_clock::universal_time()); }

std::optional<address_t> envelope_t::reply_destination() const noexcept {
    if (reply_to) {
        return reply_to;
    }
    return sender;
}

} // namespace stator
