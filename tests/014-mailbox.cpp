//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include <catch2/catch.hpp>
#include "stator.hpp"
#include <thread>

namespace s = stator;
namespace pt = boost::posix_time;

static s::envelope_ptr_t make(int value, s::priority_t priority = s::priority_t::normal) {
    auto envelope = s::make_envelope<int>(s::address_t::named("x"), value);
    envelope->with_priority(priority);
    return envelope;
}

TEST_CASE("fifo order", "[mailbox]") {
    auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());
    for (int i = 0; i < 10; ++i) {
        REQUIRE(!mailbox->send(make(i)));
    }
    CHECK(mailbox->size() == 10);
    CHECK(mailbox->get_received() == 10);
    for (int i = 0; i < 10; ++i) {
        auto envelope = mailbox->try_receive();
        REQUIRE(envelope);
        CHECK(*envelope->payload_cast<int>() == i);
    }
    CHECK(!mailbox->try_receive());
    CHECK(!mailbox->receive(pt::millisec{1}));
}

TEST_CASE("listener is notified", "[mailbox]") {
    auto mailbox = s::mailbox_ptr_t(new s::mailbox_t());
    int notified = 0;
    mailbox->set_listener([&]() { ++notified; });
    REQUIRE(!mailbox->send(make(1)));
    REQUIRE(!mailbox->send(make(2)));
    CHECK(notified == 2);
    mailbox->close();
    auto ee = mailbox->send(make(3));
    REQUIRE(ee);
    CHECK(ee->ec == s::error_code_t::mailbox_closed);
    CHECK(notified == 2);

    SECTION("pending messages survive close") {
        CHECK(mailbox->is_closed());
        CHECK(mailbox->try_receive());
        CHECK(mailbox->receive(pt::millisec{1}));
        CHECK(!mailbox->receive(pt::pos_infin));
    }
}

TEST_CASE("backpressure", "[mailbox]") {
    SECTION("error") {
        auto mailbox = s::mailbox_ptr_t(new s::mailbox_t(2, s::backpressure_t::error));
        REQUIRE(!mailbox->send(make(1)));
        REQUIRE(!mailbox->send(make(2)));
        auto ee = mailbox->send(make(3));
        REQUIRE(ee);
        CHECK(ee->ec == s::error_code_t::mailbox_full);
        CHECK(mailbox->size() == 2);
    }

    SECTION("drop") {
        auto mailbox = s::mailbox_ptr_t(new s::mailbox_t(1, s::backpressure_t::drop));
        REQUIRE(!mailbox->send(make(1)));
        REQUIRE(!mailbox->send(make(2)));
        CHECK(mailbox->size() == 1);
        CHECK(mailbox->get_dropped() == 1);
        CHECK(*mailbox->try_receive()->payload_cast<int>() == 1);
    }

    SECTION("block with timeout") {
        auto mailbox = s::mailbox_ptr_t(new s::mailbox_t(1, s::backpressure_t::block));
        REQUIRE(!mailbox->send(make(1)));
        auto started = s::utc_now();
        auto ee = mailbox->send(make(2), pt::millisec{20});
        REQUIRE(ee);
        CHECK(ee->ec == s::error_code_t::send_timeout);
        CHECK(s::utc_now() - started >= pt::millisec{15});
    }

    SECTION("block until there is space") {
        auto mailbox = s::mailbox_ptr_t(new s::mailbox_t(1, s::backpressure_t::block));
        REQUIRE(!mailbox->send(make(1)));
        std::thread consumer([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            mailbox->try_receive();
        });
        CHECK(!mailbox->send(make(2), pt::seconds{5}));
        consumer.join();
        CHECK(*mailbox->try_receive()->payload_cast<int>() == 2);
    }

    SECTION("close wakes blocked sender") {
        auto mailbox = s::mailbox_ptr_t(new s::mailbox_t(1, s::backpressure_t::block));
        REQUIRE(!mailbox->send(make(1)));
        std::thread closer([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            mailbox->close();
        });
        auto ee = mailbox->send(make(2));
        closer.join();
        REQUIRE(ee);
        CHECK(ee->ec == s::error_code_t::mailbox_closed);
    }

    SECTION("adaptive") {
        CHECK(s::backpressure_for(s::priority_t::critical) == s::backpressure_t::block);
        CHECK(s::backpressure_for(s::priority_t::high) == s::backpressure_t::block);
        CHECK(s::backpressure_for(s::priority_t::normal) == s::backpressure_t::error);
        CHECK(s::backpressure_for(s::priority_t::low) == s::backpressure_t::drop);

        auto mailbox = s::mailbox_ptr_t(new s::mailbox_t(1, s::backpressure_t::adaptive));
        REQUIRE(!mailbox->send(make(1)));
        CHECK(!mailbox->send(make(2, s::priority_t::low)));
        CHECK(mailbox->get_dropped() == 1);
        auto ee = mailbox->send(make(3));
        REQUIRE(ee);
        CHECK(ee->ec == s::error_code_t::mailbox_full);
        ee = mailbox->send(make(4, s::priority_t::high), pt::millisec{5});
        REQUIRE(ee);
        CHECK(ee->ec == s::error_code_t::send_timeout);
    }
}

TEST_CASE("envelope routing fields", "[mailbox]") {
    auto envelope = s::make_envelope<std::string>(s::address_t::named("to"), "hello");
    envelope->from(s::address_t::named("from")).reply_address(s::address_t::named("back"));
    CHECK(envelope->reply_destination() == s::address_t::named("back"));
    CHECK(envelope->priority == s::priority_t::normal);
    CHECK(!envelope->is_expired());
    CHECK(!envelope->payload_cast<int>());
    CHECK(*envelope->payload_cast<std::string>() == "hello");

    envelope->time_to_live(pt::seconds{1});
    CHECK(!envelope->is_expired(envelope->timestamp + pt::millisec{500}));
    CHECK(envelope->is_expired(envelope->timestamp + pt::seconds{2}));

    auto anonymous = s::make_envelope<int>(s::address_t::named("to"), 1);
    anonymous->from(s::address_t::named("from"));
    CHECK(anonymous->reply_destination() == s::address_t::named("from"));
}
