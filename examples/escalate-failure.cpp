//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

/*
 *
 * This is an example of failure escalation: the "fragile" actor fails
 * on every "crash" message. Its supervisor allows only one restart within
 * the window; when the budget is exhausted the supervisor reports the
 * failure to its parent, which restarts the whole subtree.
 *
 */

#include "stator.hpp"
#include <iostream>
#include <thread>

namespace s = stator;
namespace pt = boost::posix_time;

namespace payload {
struct crash_t {};
} // namespace payload

using events_t = s::in_memory_monitor_t<s::supervision_event_t>;
using events_ptr_t = s::intrusive_ptr_t<events_t>;

struct fragile_t : s::actor_base_t {
    using s::actor_base_t::actor_base_t;

    s::extended_error_ptr_t on_message(s::envelope_t &envelope) noexcept override {
        if (envelope.payload_cast<payload::crash_t>()) {
            return s::make_error(address.to_string(), std::make_error_code(std::errc::state_not_recoverable));
        }
        return {};
    }
};

template <typename Predicate> static bool wait_for(Predicate &&predicate) {
    auto deadline = s::utc_now() + pt::seconds{5};
    while (!predicate()) {
        if (s::utc_now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

static std::size_t count(const events_ptr_t &events, s::supervision_event_kind_t kind) {
    std::size_t r = 0;
    for (auto &event : events->snapshot().recent_events) {
        r += event.kind == kind ? 1 : 0;
    }
    return r;
}

int main() {
    auto ctx = s::system_context_t::configure().worker_threads(2).finish();
    if (!ctx || ctx->start()) {
        return 1;
    }

    s::supervisor_tree_t tree(*ctx);
    auto root_events = events_ptr_t(new events_t({true, 100, s::severity_t::trace}));

    s::supervisor_config_t root_config;
    root_config.identity = "root";
    root_config.monitor = root_events;

    s::supervisor_config_t mid_config;
    mid_config.identity = "fragile-keeper";
    mid_config.monitor = new s::logging_monitor_t<s::supervision_event_t>(s::get_logger("fragile-keeper"));
    mid_config.escalate_failure = true;

    s::supervisor_id_t root{}, mid{};
    s::supervisor_ptr_t keeper;
    auto ee = tree.create_supervisor({}, root_config, root);
    if (!ee) {
        ee = tree.create_supervisor(root, mid_config, mid);
    }
    if (!ee) {
        ee = tree.get_supervisor(mid, keeper);
    }
    if (ee) {
        std::cout << "cannot build supervisor tree: " << ee->message() << "\n";
        return 1;
    }

    auto address = s::address_t::named("fragile");
    auto &context = *ctx;
    auto descriptor = s::describe_child("fragile", [&context, address]() -> s::child_ptr_t {
                          return context.make_actor<fragile_t>(address);
                      })
                          .backoff(s::backoff_config_t::fixed(1, pt::seconds{10}, pt::millisec{10}))
                          .finish();
    s::child_id_t id{};
    if (auto ee = keeper->start_child(descriptor, id); ee) {
        std::cout << "cannot start child: " << ee->message() << "\n";
        return 1;
    }

    auto &bus = ctx->get_bus();
    auto crash = [&]() {
        if (auto ee = bus.publish(s::make_envelope<payload::crash_t>(address)); ee) {
            std::cout << "cannot publish: " << ee->message() << "\n";
        }
    };

    crash();
    if (!wait_for([&]() { return keeper->health_snapshot().at(0).restart_count == 1; })) {
        std::cout << "fragile actor has not been restarted\n";
        return 1;
    }
    std::cout << "fragile actor has been restarted by its supervisor\n";

    crash();
    if (wait_for([&]() { return count(root_events, s::supervision_event_kind_t::restarted) == 1; })) {
        std::cout << "the failure has been escalated, root restarted the subtree\n";
    }
    for (auto &event : root_events->snapshot().recent_events) {
        std::cout << "root event: " << event.to_string() << "\n";
    }

    if (auto ee = tree.shutdown(); ee) {
        std::cout << "tree shutdown failure: " << ee->message() << "\n";
    }
    ctx->shutdown();
    return 0;
}
