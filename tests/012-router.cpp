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
struct job_t {
    std::string data;
};
} // namespace payload

using bus_events_t = s::in_memory_monitor_t<s::bus_event_t>;

TEST_CASE("worker receives published envelope", "[router]") {
    auto ctx = st::make_context();
    auto &registry = ctx->get_registry();
    auto worker = s::address_t::named("worker");
    auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());
    REQUIRE(!registry.register_mailbox(worker, mailbox));

    auto envelope = s::make_envelope<payload::job_t>(worker, "X");
    REQUIRE(!ctx->get_bus().publish(envelope));

    auto received = mailbox->receive(pt::seconds{2});
    REQUIRE(received);
    auto job = received->payload_cast<payload::job_t>();
    REQUIRE(job);
    CHECK(job->data == "X");
    CHECK(!mailbox->receive(pt::millisec{50}));
    CHECK(ctx->get_router().get_delivered() == 1);
    ctx->shutdown();
}

TEST_CASE("delivery order per mailbox", "[router]") {
    auto ctx = st::make_context(4);
    auto worker = s::address_t::named("worker");
    auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());
    REQUIRE(!ctx->get_registry().register_mailbox(worker, mailbox));

    for (int i = 0; i < 50; ++i) {
        REQUIRE(!ctx->get_bus().publish(s::make_envelope<int>(worker, i)));
    }
    for (int i = 0; i < 50; ++i) {
        auto received = mailbox->receive(pt::seconds{2});
        REQUIRE(received);
        CHECK(*received->payload_cast<int>() == i);
    }
    ctx->shutdown();
}

TEST_CASE("undeliverable envelopes become dead letters", "[router]") {
    auto monitor = s::intrusive_ptr_t<bus_events_t>(new bus_events_t({true, 100, s::severity_t::warning}));
    auto ctx =
        s::system_context_t::configure().worker_threads(2).dead_letters_capacity(2).bus_monitor(monitor).finish();
    REQUIRE(ctx);
    REQUIRE(!ctx->start());
    auto &router = ctx->get_router();
    auto &dead_letters = router.get_dead_letters();

    SECTION("unknown recipient does not stop the router") {
        auto worker = s::address_t::named("worker");
        auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());
        REQUIRE(!ctx->get_registry().register_mailbox(worker, mailbox));

        auto lost = s::make_envelope<payload::job_t>(s::address_t::named("nobody"), "lost");
        REQUIRE(!ctx->get_bus().publish(lost));
        REQUIRE(!ctx->get_bus().publish(s::make_envelope<payload::job_t>(worker, "found")));

        auto received = mailbox->receive(pt::seconds{2});
        REQUIRE(received);
        CHECK(received->payload_cast<payload::job_t>()->data == "found");
        REQUIRE(st::wait_until([&]() { return dead_letters.size() == 1; }));

        auto letters = dead_letters.drain();
        REQUIRE(letters.size() == 1);
        CHECK(letters[0].envelope == lost);
        CHECK(letters[0].reason->ec == s::error_code_t::address_not_found);
        CHECK(dead_letters.size() == 0);
        CHECK(dead_letters.get_total() == 1);

        auto snapshot = monitor->snapshot();
        REQUIRE(snapshot.recent_events.size() == 1);
        CHECK(snapshot.recent_events[0].kind == s::bus_event_kind_t::undeliverable);
        CHECK(snapshot.count(s::severity_t::error) == 1);
    }

    SECTION("closed mailbox") {
        auto worker = s::address_t::named("worker");
        auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());
        REQUIRE(!ctx->get_registry().register_mailbox(worker, mailbox));
        mailbox->close();
        REQUIRE(!ctx->get_bus().publish(s::make_envelope<payload::job_t>(worker, "x")));
        REQUIRE(st::wait_until([&]() { return dead_letters.size() == 1; }));
        auto letters = dead_letters.drain();
        auto &reason = letters.at(0).reason;
        CHECK(reason->ec == s::error_code_t::mailbox_closed);
        REQUIRE(reason->next);
        CHECK(reason->next->ec == s::error_code_t::mailbox_closed);
    }

    SECTION("expired envelope") {
        auto worker = s::address_t::named("worker");
        auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());
        REQUIRE(!ctx->get_registry().register_mailbox(worker, mailbox));
        auto envelope = s::make_envelope<payload::job_t>(worker, "stale");
        envelope->time_to_live(pt::millisec{1});
        envelope->timestamp -= pt::seconds{1};
        REQUIRE(!ctx->get_bus().publish(envelope));
        REQUIRE(st::wait_until([&]() { return dead_letters.size() == 1; }));
        CHECK(dead_letters.drain().at(0).reason->ec == s::error_code_t::message_expired);
        CHECK(mailbox->size() == 0);
        CHECK(monitor->snapshot().recent_events.at(0).kind == s::bus_event_kind_t::expired);
    }

    SECTION("dead letters are bounded") {
        for (int i = 0; i < 5; ++i) {
            REQUIRE(!ctx->get_bus().publish(s::make_envelope<int>(s::address_t::named("nobody"), i)));
        }
        REQUIRE(st::wait_until([&]() { return dead_letters.get_total() == 5; }));
        auto letters = dead_letters.drain();
        REQUIRE(letters.size() == 2);
        CHECK(*letters[0].envelope->payload_cast<int>() == 3);
        CHECK(*letters[1].envelope->payload_cast<int>() == 4);
    }
    ctx->shutdown();
}

TEST_CASE("pool delivery", "[router]") {
    auto ctx = st::make_context();
    std::vector<s::mailbox_ptr_t> mailboxes;
    for (int i = 0; i < 3; ++i) {
        auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());
        auto address = s::address_t::pool_member("workers", "w" + std::to_string(i));
        REQUIRE(!ctx->get_registry().register_mailbox(address, mailbox));
        mailboxes.push_back(mailbox);
    }

    for (int i = 0; i < 9; ++i) {
        REQUIRE(!ctx->get_bus().publish(s::make_envelope<int>(s::address_t::pool("workers"), i)));
    }
    REQUIRE(st::wait_until([&]() { return ctx->get_router().get_delivered() == 9; }));
    for (auto &mailbox : mailboxes) {
        CHECK(mailbox->size() == 3);
    }

    SECTION("unknown pool") {
        REQUIRE(!ctx->get_bus().publish(s::make_envelope<int>(s::address_t::pool("nobody"), 0)));
        auto &dead_letters = ctx->get_router().get_dead_letters();
        REQUIRE(st::wait_until([&]() { return dead_letters.size() == 1; }));
        CHECK(dead_letters.drain().at(0).reason->ec == s::error_code_t::pool_not_found);
    }
    ctx->shutdown();
}

TEST_CASE("stopped router ignores new envelopes", "[router]") {
    auto ctx = st::make_context();
    auto worker = s::address_t::named("worker");
    auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());
    REQUIRE(!ctx->get_registry().register_mailbox(worker, mailbox));
    auto &router = ctx->get_router();
    CHECK(router.is_running());
    CHECK(ctx->get_bus().subscribers_count() == 1);

    ctx->shutdown();
    CHECK(!router.is_running());
    CHECK(ctx->is_shutting_down());
    CHECK(ctx->get_bus().subscribers_count() == 0);
    REQUIRE(!ctx->get_bus().publish(s::make_envelope<int>(worker, 1)));
    CHECK(mailbox->size() == 0);
    CHECK(router.get_delivered() == 0);

    auto ee = ctx->start();
    REQUIRE(ee);
    CHECK(ee->ec == s::supervision_code_t::supervisor_shutting_down);
}

TEST_CASE("synchronous delivery into the full mailbox", "[router]") {
    boost::asio::io_context io_context;
    auto registry = s::registry_ptr_t(new s::registry_t());
    auto bus = s::bus_ptr_t(new s::bus_t(io_context));
    auto router = s::router_ptr_t(new s::router_t(io_context, registry, bus, {pt::millisec{5}}));
    auto worker = s::address_t::named("worker");
    auto mailbox = s::mailbox_ptr_t(new s::mailbox_t(1, s::backpressure_t::block));
    REQUIRE(!registry->register_mailbox(worker, mailbox));

    REQUIRE(!router->deliver(s::make_envelope<int>(worker, 1)));
    auto ee = router->deliver(s::make_envelope<int>(worker, 2));
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::send_timeout);
    CHECK(router->get_dead_letters().size() == 1);
    CHECK(router->get_delivered() == 1);

    ee = router->deliver(s::make_unaddressed<int>(3));
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::route_misconfigured);
}
