//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

/*
 *
 * The responder actor squares numbers. The first request is performed
 * synchronously (the caller thread is blocked until the reply arrives or
 * the timeout elapses), the following ones asynchronously, with the reply
 * handler invoked exactly once.
 *
 */

#include "stator.hpp"
#include <iostream>
#include <thread>

namespace s = stator;
namespace pt = boost::posix_time;

namespace payload {
struct square_t {
    int value;
};
struct squared_t {
    int value;
};
} // namespace payload

struct responder_t : s::actor_base_t {
    using s::actor_base_t::actor_base_t;

    s::extended_error_ptr_t on_message(s::envelope_t &envelope) noexcept override {
        if (auto request = envelope.payload_cast<payload::square_t>(); request) {
            return reply<payload::squared_t>(envelope, request->value * request->value);
        }
        return {};
    }
};

int main() {
    auto ctx = s::system_context_t::configure().worker_threads(2).finish();
    if (!ctx || ctx->start()) {
        return 1;
    }

    auto address = s::address_t::named("squarer");
    auto responder = ctx->make_actor<responder_t>(address);
    if (auto ee = responder->start(); ee) {
        std::cout << "cannot start responder: " << ee->message() << "\n";
        return 1;
    }

    auto &bus = ctx->get_bus();
    s::envelope_ptr_t reply;
    auto ee = bus.publish_request(s::make_envelope<payload::square_t>(address, 7), pt::seconds{1}, reply);
    const payload::squared_t *squared = nullptr;
    if (!ee) {
        ee = s::reply_as(reply, squared);
    }
    if (ee) {
        std::cout << "request failed: " << ee->message() << "\n";
    } else {
        std::cout << "7 * 7 = " << squared->value << "\n";
    }

    std::atomic_int replies{0};
    for (int i = 1; i <= 5; ++i) {
        auto handler = [i, &replies](s::envelope_ptr_t reply) {
            const payload::squared_t *squared = nullptr;
            if (auto ee = s::reply_as(reply, squared); ee) {
                std::cout << "request " << i << " failed: " << ee->message() << "\n";
            } else {
                std::cout << i << " * " << i << " = " << squared->value << "\n";
            }
            ++replies;
        };
        auto envelope = s::make_envelope<payload::square_t>(address, i);
        if (auto ee = bus.async_request(std::move(envelope), pt::millisec{500}, std::move(handler)); ee) {
            std::cout << "cannot send request: " << ee->message() << "\n";
            ++replies;
        }
    }
    while (replies < 5) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    if (auto ee = responder->stop(pt::seconds{1}); ee) {
        std::cout << "cannot stop responder: " << ee->message() << "\n";
    }
    ctx->shutdown();
    return 0;
}
