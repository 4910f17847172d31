//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include <catch2/catch.hpp>
#include "stator/strategy.h"
#include "stator/address.hpp"

namespace s = stator;

TEST_CASE("restart set", "[strategy]") {
    auto a = s::make_uuid();
    auto b = s::make_uuid();
    auto c = s::make_uuid();
    auto unknown = s::make_uuid();
    auto ordered = std::vector<s::child_id_t>{a, b, c};
    using ids_t = std::vector<s::child_id_t>;

    CHECK(s::restart_set(s::strategy_t::isolate_one, b, ordered) == ids_t{b});
    CHECK(s::restart_set(s::strategy_t::restart_all, b, ordered) == ids_t{a, b, c});
    CHECK(s::restart_set(s::strategy_t::restart_tail, b, ordered) == ids_t{b, c});
    CHECK(s::restart_set(s::strategy_t::restart_tail, a, ordered) == ids_t{a, b, c});
    CHECK(s::restart_set(s::strategy_t::restart_tail, c, ordered) == ids_t{c});

    for (auto strategy : {s::strategy_t::isolate_one, s::strategy_t::restart_all, s::strategy_t::restart_tail}) {
        CHECK(s::restart_set(strategy, unknown, ordered).empty());
        CHECK(s::restart_set(strategy, a, {}).empty());
    }

    CHECK(std::string(s::to_string(s::strategy_t::isolate_one)) == "isolate_one");
    CHECK(std::string(s::to_string(s::strategy_t::restart_tail)) == "restart_tail");
}
