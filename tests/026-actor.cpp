//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include <catch2/catch.hpp>
#include "access.h"
#include "sample_child.h"

namespace s = stator;
namespace st = s::test;
namespace pt = boost::posix_time;

namespace payload {
struct add_t {
    int value;
};
struct ping_t {};
struct pong_t {};
} // namespace payload

struct stats_t {
    std::atomic_int instances{0};
    std::atomic_int total{0};
    std::atomic_int pongs{0};
    std::atomic_int stops{0};
};
using stats_ptr_t = std::shared_ptr<stats_t>;

struct adder_t : s::actor_base_t {
    adder_t(s::system_context_t &ctx, const s::address_t &address, stats_ptr_t stats_)
        : s::actor_base_t(ctx, address), stats{std::move(stats_)} {
        ++stats->instances;
    }

    s::extended_error_ptr_t on_message(s::envelope_t &envelope) noexcept override {
        auto add = envelope.payload_cast<payload::add_t>();
        if (!add) {
            return s::make_error(address.to_string(), s::error_code_t::payload_type_mismatch);
        }
        if (add->value < 0) {
            return st::make_test_error("negative value");
        }
        stats->total += add->value;
        return {};
    }

    void on_stop() noexcept override { ++stats->stops; }

    stats_ptr_t stats;
};

struct ponger_t : s::actor_base_t {
    using s::actor_base_t::actor_base_t;

    s::extended_error_ptr_t on_message(s::envelope_t &envelope) noexcept override {
        if (envelope.payload_cast<payload::ping_t>()) {
            return reply<payload::pong_t>(envelope);
        }
        return {};
    }
};

struct pinger_t : s::actor_base_t {
    pinger_t(s::system_context_t &ctx, const s::address_t &address, s::address_t ponger_, stats_ptr_t stats_)
        : s::actor_base_t(ctx, address), ponger{std::move(ponger_)}, stats{std::move(stats_)} {}

    s::extended_error_ptr_t ping() noexcept { return send<payload::ping_t>(ponger); }

    s::extended_error_ptr_t on_message(s::envelope_t &envelope) noexcept override {
        if (envelope.payload_cast<payload::pong_t>() && envelope.sender == ponger) {
            ++stats->pongs;
        }
        return {};
    }

    s::address_t ponger;
    stats_ptr_t stats;
};

TEST_CASE("actor lifecycle", "[actor]") {
    auto ctx = st::make_context();
    auto stats = std::make_shared<stats_t>();
    auto address = s::address_t::named("adder");
    auto actor = ctx->make_actor<adder_t>(address, stats);
    CHECK(!actor->is_active());

    REQUIRE(!actor->start());
    CHECK(actor->is_active());
    s::mailbox_ptr_t mailbox;
    REQUIRE(!ctx->get_registry().resolve(address, mailbox));
    CHECK(mailbox == actor->get_mailbox());

    auto &bus = ctx->get_bus();
    for (int i = 1; i <= 10; ++i) {
        REQUIRE(!bus.publish(s::make_envelope<payload::add_t>(address, i)));
    }
    REQUIRE(st::wait_until([&]() { return stats->total == 55; }));
    CHECK(actor->get_processed() == 10);

    REQUIRE(!actor->stop(pt::seconds{1}));
    CHECK(!actor->is_active());
    CHECK(stats->stops == 1);
    CHECK(actor->get_mailbox()->is_closed());
    CHECK(ctx->get_registry().resolve(address, mailbox));

    REQUIRE(!bus.publish(s::make_envelope<payload::add_t>(address, 100)));
    auto &dead_letters = ctx->get_router().get_dead_letters();
    REQUIRE(st::wait_until([&]() { return dead_letters.size() == 1; }));
    CHECK(stats->total == 55);

    auto ee = actor->start();
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::mailbox_closed);
    ctx->shutdown();
}

TEST_CASE("supervised actor is restarted on failure", "[actor]") {
    auto ctx = st::make_context();
    auto monitor = s::intrusive_ptr_t<s::in_memory_monitor_t<s::supervision_event_t>>(
        new s::in_memory_monitor_t<s::supervision_event_t>({true, 100, s::severity_t::trace}));
    auto sup = ctx->create_supervisor().identity("adders").monitor(monitor).finish();
    REQUIRE(sup);

    auto stats = std::make_shared<stats_t>();
    auto address = s::address_t::named("adder");
    s::system_context_ptr_t context = ctx;
    auto factory = [context, address, stats]() -> s::child_ptr_t {
        return context->make_actor<adder_t>(address, stats);
    };
    auto backoff = s::backoff_config_t::fixed(5, pt::seconds{10}, pt::time_duration{});
    s::child_id_t id{};
    REQUIRE(!sup->start_child(s::describe_child("adder", factory).backoff(backoff).finish(), id));

    auto &bus = ctx->get_bus();
    REQUIRE(!bus.publish(s::make_envelope<payload::add_t>(address, 1)));
    REQUIRE(!bus.publish(s::make_envelope<payload::add_t>(address, -1)));
    REQUIRE(st::wait_until([&]() { return stats->instances == 2; }));
    REQUIRE(st::wait_until([&]() { return sup->health_snapshot().at(0).restart_count == 1; }));

    REQUIRE(!bus.publish(s::make_envelope<payload::add_t>(address, 10)));
    REQUIRE(st::wait_until([&]() { return stats->total == 11; }));
    CHECK(stats->stops == 1);

    auto snapshot = monitor->snapshot();
    CHECK(snapshot.count(s::severity_t::error) == 1);
    CHECK(snapshot.count(s::severity_t::warning) == 1);

    REQUIRE(!sup->shutdown());
    CHECK(stats->stops == 2);
    s::mailbox_ptr_t mailbox;
    CHECK(ctx->get_registry().resolve(address, mailbox));
    ctx->shutdown();
}

TEST_CASE("ping pong", "[actor]") {
    auto ctx = st::make_context(3);
    auto stats = std::make_shared<stats_t>();
    auto ponger_address = s::address_t::named("ponger");
    auto ponger = ctx->make_actor<ponger_t>(ponger_address);
    REQUIRE(!ponger->start());

    auto pingers = std::vector<s::intrusive_ptr_t<pinger_t>>();
    for (int i = 0; i < 5; ++i) {
        auto pinger = ctx->make_actor<pinger_t>(s::address_t::anonymous(), ponger_address, stats);
        REQUIRE(!pinger->start());
        pingers.push_back(pinger);
    }
    for (auto &pinger : pingers) {
        REQUIRE(!pinger->ping());
    }
    REQUIRE(st::wait_until([&]() { return stats->pongs == 5; }));
    CHECK(ponger->get_processed() == 5);

    for (auto &pinger : pingers) {
        REQUIRE(!pinger->stop(pt::seconds{1}));
    }
    REQUIRE(!ponger->stop(pt::seconds{1}));
    CHECK(ctx->get_registry().size() == 0);
    ctx->shutdown();
}
