//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include <catch2/catch.hpp>
#include "access.h"

namespace s = stator;
namespace st = s::test;
namespace pt = boost::posix_time;

namespace payload {
struct sample_t {
    int value;
};
} // namespace payload

using bus_events_t = s::in_memory_monitor_t<s::bus_event_t>;

TEST_CASE("broadcast completeness", "[bus]") {
    boost::asio::io_context io_context;
    auto bus = s::bus_ptr_t(new s::bus_t(io_context));

    std::vector<s::stream_ptr_t> streams;
    for (int i = 0; i < 5; ++i) {
        streams.push_back(bus->subscribe());
    }
    CHECK(bus->subscribers_count() == 5);

    auto envelope = s::make_envelope<payload::sample_t>(s::address_t::named("x"), 42);
    REQUIRE(!bus->publish(envelope));

    for (auto &stream : streams) {
        CHECK(stream->size() == 1);
        auto received = stream->try_receive();
        REQUIRE(received);
        CHECK(received == envelope);
        auto p = received->payload_cast<payload::sample_t>();
        REQUIRE(p);
        CHECK(p->value == 42);
        CHECK(!stream->try_receive());
    }
}

TEST_CASE("closed subscribers are pruned", "[bus]") {
    boost::asio::io_context io_context;
    auto bus = s::bus_ptr_t(new s::bus_t(io_context));
    auto s1 = bus->subscribe();
    auto s2 = bus->subscribe();
    auto s3 = bus->subscribe();

    s2->close();
    CHECK(bus->subscribers_count() == 3);

    REQUIRE(!bus->publish(s::make_envelope<payload::sample_t>(s::address_t::named("x"), 1)));
    CHECK(s1->size() == 1);
    CHECK(s3->size() == 1);
    CHECK(s2->size() == 0);
    CHECK(bus->subscribers_count() == 2);

    SECTION("unsubscribe closes the stream") {
        bus->unsubscribe(s1);
        CHECK(s1->is_closed());
        CHECK(bus->subscribers_count() == 1);
        REQUIRE(!bus->publish(s::make_envelope<payload::sample_t>(s::address_t::named("x"), 2)));
        CHECK(s1->size() == 1);
        CHECK(s3->size() == 2);
    }
}

TEST_CASE("publish without recipient", "[bus]") {
    boost::asio::io_context io_context;
    auto monitor = s::intrusive_ptr_t<bus_events_t>(new bus_events_t({true, 10, s::severity_t::trace}));
    auto bus = s::bus_ptr_t(new s::bus_t(io_context, monitor));
    auto stream = bus->subscribe();

    auto ee = bus->publish(s::make_unaddressed<payload::sample_t>(5));
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::route_misconfigured);
    CHECK(stream->size() == 0);
    CHECK(monitor->snapshot().total_events == 0);

    REQUIRE(!bus->publish(s::make_envelope<payload::sample_t>(s::address_t::named("x"), 1)));
    auto snapshot = monitor->snapshot();
    REQUIRE(snapshot.recent_events.size() == 1);
    CHECK(snapshot.recent_events[0].kind == s::bus_event_kind_t::published);
    CHECK(snapshot.recent_events[0].address == s::address_t::named("x"));
}

TEST_CASE("async request", "[bus]") {
    boost::asio::io_context io_context;
    auto monitor = s::intrusive_ptr_t<bus_events_t>(new bus_events_t({true, 10, s::severity_t::trace}));
    auto bus = s::bus_ptr_t(new s::bus_t(io_context, monitor));
    auto stream = bus->subscribe();

    int invoked = 0;
    s::envelope_ptr_t reply;
    auto handler = [&](s::envelope_ptr_t value) {
        ++invoked;
        reply = std::move(value);
    };

    SECTION("replied") {
        auto request = s::make_envelope<payload::sample_t>(s::address_t::named("x"), 1);
        REQUIRE(!bus->async_request(request, pt::seconds{10}, handler));
        CHECK(bus->pending_requests() == 1);
        REQUIRE(request->correlation_id);
        auto received = stream->try_receive();
        REQUIRE(received == request);

        REQUIRE(!bus->reply<payload::sample_t>(*received, 2));
        CHECK(invoked == 1);
        CHECK(bus->pending_requests() == 0);
        REQUIRE(reply);
        CHECK(reply->correlation_id == request->correlation_id);
        CHECK(reply->payload_cast<payload::sample_t>()->value == 2);

        SECTION("second reply is discarded") {
            REQUIRE(!bus->reply<payload::sample_t>(*received, 3));
            CHECK(invoked == 1);
            CHECK(monitor->snapshot().recent_events.back().kind == s::bus_event_kind_t::late_reply);
        }
        io_context.run();
        CHECK(invoked == 1);
    }

    SECTION("timed out") {
        auto request = s::make_envelope<payload::sample_t>(s::address_t::named("x"), 1);
        REQUIRE(!bus->async_request(request, pt::millisec{1}, handler));
        io_context.run();
        CHECK(invoked == 1);
        CHECK(!reply);
        CHECK(bus->pending_requests() == 0);

        REQUIRE(!bus->reply<payload::sample_t>(*request, 2));
        CHECK(invoked == 1);
        auto events = monitor->snapshot().recent_events;
        REQUIRE(events.size() >= 2);
        CHECK(events[events.size() - 2].kind == s::bus_event_kind_t::request_timeout);
        CHECK(events.back().kind == s::bus_event_kind_t::late_reply);
    }

    SECTION("publish failure removes pending request") {
        auto request = s::make_unaddressed<payload::sample_t>(1);
        auto ee = bus->async_request(request, pt::seconds{10}, handler);
        REQUIRE(ee);
        CHECK(ee->ec == s::error_code_t::route_misconfigured);
        CHECK(bus->pending_requests() == 0);
        io_context.run();
        CHECK(invoked == 0);
    }

    SECTION("cancellation") {
        auto request = s::make_envelope<payload::sample_t>(s::address_t::named("x"), 1);
        REQUIRE(!bus->async_request(request, pt::seconds{10}, handler));
        bus->cancel_requests();
        CHECK(invoked == 1);
        CHECK(!reply);
        CHECK(bus->pending_requests() == 0);
        io_context.run();
        CHECK(invoked == 1);
    }
}

TEST_CASE("reply payload extraction", "[bus]") {
    auto request = s::make_envelope<payload::sample_t>(s::address_t::named("x"), 1);
    request->from(s::address_t::named("client"));
    request->correlation_id = s::make_uuid();

    const payload::sample_t *sample = nullptr;
    auto ee = s::reply_as(s::envelope_ptr_t{}, sample);
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::request_timeout);

    auto reply = s::make_reply<std::string>(*request, "text");
    CHECK(reply->recipient == s::address_t::named("client"));
    CHECK(reply->reply);
    ee = s::reply_as(reply, sample);
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::payload_type_mismatch);
    CHECK(!sample);

    const std::string *text = nullptr;
    REQUIRE(!s::reply_as(reply, text));
    CHECK(*text == "text");
}
