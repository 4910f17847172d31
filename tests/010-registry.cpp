//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include <catch2/catch.hpp>
#include "access.h"
#include <set>
#include <thread>

namespace s = stator;
namespace st = s::test;
namespace pt = boost::posix_time;

TEST_CASE("address kinds", "[registry]") {
    auto a1 = s::address_t::named("worker");
    auto a2 = s::address_t::named("worker");
    auto a3 = s::address_t::anonymous();
    auto a4 = s::address_t::anonymous();
    auto m1 = s::address_t::pool_member("workers", "w1");
    auto p = s::address_t::pool("workers");

    CHECK(a1 == a2);
    CHECK(a1.routing_key() == a2.routing_key());
    CHECK(a3 != a4);
    CHECK(a1 != m1);
    CHECK(m1.get_pool() == "workers");
    CHECK(m1.get_name() == "w1");
    CHECK(p.is_pool());
    CHECK(!m1.is_pool());
    CHECK(a3.get_name().empty());
    CHECK(a1.to_string() != a3.to_string());
}

TEST_CASE("resolution stability", "[registry]") {
    auto registry = s::registry_ptr_t(new s::registry_t(4));
    auto address = s::address_t::named("worker");
    auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());

    s::mailbox_ptr_t resolved;
    auto ee = registry->resolve(address, resolved);
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::address_not_found);
    CHECK(!resolved);

    REQUIRE(!registry->register_mailbox(address, mailbox));
    CHECK(registry->size() == 1);
    for (int i = 0; i < 10; ++i) {
        s::mailbox_ptr_t m;
        REQUIRE(!registry->resolve(address, m));
        CHECK(m == mailbox);
    }
    CHECK(registry->resolve(address.routing_key()) == mailbox);

    REQUIRE(!registry->unregister(address));
    CHECK(registry->size() == 0);
    ee = registry->resolve(address, resolved);
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::address_not_found);
    CHECK(!registry->resolve(address.routing_key()));

    SECTION("double unregister is reported") {
        ee = registry->unregister(address);
        REQUIRE(ee);
        CHECK(ee->ec == s::error_code_t::address_not_found);
    }
}

TEST_CASE("re-registration replaces mailbox", "[registry]") {
    auto registry = s::registry_ptr_t(new s::registry_t(4));
    auto address = s::address_t::named("worker");
    auto m1 = s::mailbox_ptr_t(new s::mailbox_t());
    auto m2 = s::mailbox_ptr_t(new s::mailbox_t());

    REQUIRE(!registry->register_mailbox(address, m1));
    REQUIRE(!registry->register_mailbox(address, m2));
    CHECK(registry->size() == 1);

    s::mailbox_ptr_t resolved;
    REQUIRE(!registry->resolve(address, resolved));
    CHECK(resolved == m2);

    SECTION("stale owner cannot unregister") {
        auto ee = registry->unregister(address, m1.get());
        REQUIRE(ee);
        CHECK(ee->ec == s::error_code_t::address_not_found);
        CHECK(registry->size() == 1);
        CHECK(!registry->unregister(address, m2.get()));
        CHECK(registry->size() == 0);
    }
}

TEST_CASE("invalid registrations", "[registry]") {
    auto registry = s::registry_ptr_t(new s::registry_t(4));
    auto ee = registry->register_mailbox(s::address_t::named("x"), {});
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::registry_internal);

    ee = registry->register_mailbox(s::address_t::pool("x"), new s::mailbox_t());
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::route_misconfigured);
    CHECK(registry->size() == 0);
}

TEST_CASE("pools", "[registry]") {
    auto registry = s::registry_ptr_t(new s::registry_t(4));
    CHECK(!registry->pool_member("workers", s::pool_strategy_t::round_robin));

    std::vector<s::address_t> members;
    for (int i = 0; i < 3; ++i) {
        auto address = s::address_t::pool_member("workers", "w" + std::to_string(i));
        REQUIRE(!registry->register_mailbox(address, new s::mailbox_t()));
        members.push_back(address);
    }
    REQUIRE(!registry->register_mailbox(members[0], new s::mailbox_t()));
    CHECK(registry->pool_size("workers") == 3);
    CHECK(registry->pool_count() == 1);

    SECTION("round robin visits every member in turn") {
        std::vector<s::address_t> picked;
        for (int i = 0; i < 6; ++i) {
            auto member = registry->pool_member("workers", s::pool_strategy_t::round_robin);
            REQUIRE(member);
            picked.push_back(*member);
        }
        for (int i = 0; i < 3; ++i) {
            CHECK(picked[i] == picked[i + 3]);
        }
        std::set<std::string> names;
        for (int i = 0; i < 3; ++i) {
            names.insert(picked[i].get_name());
        }
        CHECK(names.size() == 3);
    }

    SECTION("random selection picks a member") {
        for (int i = 0; i < 20; ++i) {
            auto member = registry->pool_member("workers", s::pool_strategy_t::random);
            REQUIRE(member);
            CHECK(member->get_pool() == "workers");
        }
    }

    SECTION("unregister leaves the pool") {
        REQUIRE(!registry->unregister(members[1]));
        CHECK(registry->pool_size("workers") == 2);
        for (int i = 0; i < 10; ++i) {
            auto member = registry->pool_member("workers", s::pool_strategy_t::round_robin);
            REQUIRE(member);
            CHECK(*member != members[1]);
        }
        REQUIRE(!registry->unregister(members[0]));
        REQUIRE(!registry->unregister(members[2]));
        CHECK(registry->pool_count() == 0);
        CHECK(!registry->pool_member("workers", s::pool_strategy_t::random));
    }
}

TEST_CASE("sharding", "[registry]") {
    auto registry = s::registry_ptr_t(new s::registry_t(8));
    CHECK(registry->access<st::to::shards>().size() == 8);
    for (int i = 0; i < 256; ++i) {
        REQUIRE(!registry->register_mailbox(s::address_t::named("a" + std::to_string(i)), new s::mailbox_t()));
    }
    CHECK(registry->size() == 256);
    CHECK(st::shards_used(*registry) > 1);
}

TEST_CASE("concurrent readers and writers", "[registry]") {
    auto registry = s::registry_ptr_t(new s::registry_t(4));
    auto stable = s::address_t::named("stable");
    auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());
    REQUIRE(!registry->register_mailbox(stable, mailbox));

    std::atomic_int mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 1000; ++i) {
                s::mailbox_ptr_t m;
                if (registry->resolve(stable, m) || m != mailbox) {
                    ++mismatches;
                }
            }
        });
    }
    threads.emplace_back([&]() {
        for (int i = 0; i < 500; ++i) {
            auto address = s::address_t::named("tmp" + std::to_string(i));
            if (registry->register_mailbox(address, new s::mailbox_t()) || registry->unregister(address)) {
                ++mismatches;
            }
        }
    });
    for (auto &thread : threads) {
        thread.join();
    }
    CHECK(mismatches == 0);
    CHECK(registry->size() == 1);
}

TEST_CASE("pool membership follows registration under contention", "[registry]") {
    auto registry = s::registry_ptr_t(new s::registry_t(4));
    auto member = s::address_t::pool_member("workers", "w1");

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 1000; ++i) {
                auto ee = registry->register_mailbox(member, new s::mailbox_t());
                if (!ee) {
                    ee = registry->unregister(member);
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    s::mailbox_ptr_t mailbox;
    auto registered = !registry->resolve(member, mailbox);
    CHECK(registry->pool_size("workers") == (registered ? 1u : 0u));
    CHECK(registry->pool_count() == (registered ? 1u : 0u));
    if (registered) {
        REQUIRE(!registry->unregister(member));
    }
    CHECK(!registry->pool_member("workers", s::pool_strategy_t::round_robin));
}
