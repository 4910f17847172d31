//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/router.h"

using namespace stator;

dead_letters_t::dead_letters_t(std::size_t capacity_) noexcept : capacity{capacity_} {}

void dead_letters_t::push(dead_letter_t letter) noexcept {
    total.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex);
    if (!capacity) {
        return;
    }
    if (letters.size() >= capacity) {
        letters.pop_front();
    }
    letters.emplace_back(std::move(letter));
}

auto dead_letters_t::drain() noexcept -> letters_t {
    std::lock_guard<std::mutex> lock(mutex);
    letters_t r(std::make_move_iterator(letters.begin()), std::make_move_iterator(letters.end()));
    letters.clear();
    return r;
}

std::size_t dead_letters_t::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex);
    return letters.size();
}

router_t::router_t(asio::io_context &io_context, registry_ptr_t registry_, bus_ptr_t bus_,
                   const router_config_t &config_) noexcept
    : strand{io_context}, registry{std::move(registry_)}, bus{std::move(bus_)}, config{config_},
      log{get_logger("stator.router")}, dead_letters{config_.dead_letters_capacity} {}

void router_t::start() noexcept {
    if (running.exchange(true)) {
        return;
    }
    stream = bus->subscribe();
    auto self = intrusive_ptr_t<router_t>(this);
    stream->set_listener([self = std::move(self)]() { self->schedule(); });
    LOG_DEBUG(log, "router has been started");
    schedule();
}

void router_t::stop() noexcept {
    if (!running.exchange(false)) {
        return;
    }
    bus->unsubscribe(stream);
    auto left = stream->size();
    if (left) {
        LOG_WARN(log, "router has been stopped, {} envelope(s) left undelivered", left);
    } else {
        LOG_DEBUG(log, "router has been stopped");
    }
}

void router_t::schedule() noexcept {
    if (!scheduled.exchange(true)) {
        auto self = intrusive_ptr_t<router_t>(this);
        asio::post(strand, [self = std::move(self)]() { self->process(); });
    }
}

void router_t::process() noexcept {
    scheduled.store(false);
    while (is_running()) {
        auto envelope = stream->try_receive();
        if (!envelope) {
            break;
        }
        deliver(envelope);
    }
}

extended_error_ptr_t router_t::deliver(const envelope_ptr_t &envelope) noexcept {
    if (!envelope->recipient) {
        auto ee = make_error("router", error_code_t::route_misconfigured);
        give_up(envelope, bus_event_kind_t::undeliverable, ee);
        return ee;
    }
    if (envelope->is_expired()) {
        auto ee = make_error(envelope->recipient->to_string(), error_code_t::message_expired);
        give_up(envelope, bus_event_kind_t::expired, ee);
        return ee;
    }

    auto address = *envelope->recipient;
    if (address.is_pool()) {
        auto member = registry->pool_member(address.get_pool(), config.pool_strategy);
        if (!member) {
            auto ee = make_error(address.to_string(), error_code_t::pool_not_found);
            give_up(envelope, bus_event_kind_t::undeliverable, ee);
            return ee;
        }
        address = std::move(*member);
    }

    mailbox_ptr_t mailbox;
    auto ee = registry->resolve(address, mailbox);
    if (!ee) {
        auto send_ee = mailbox->send(envelope, config.send_timeout);
        if (send_ee) {
            ee = make_error(address.to_string(), send_ee->ec, send_ee);
        }
    }
    if (ee) {
        give_up(envelope, bus_event_kind_t::undeliverable, ee);
        return ee;
    }

    delivered.fetch_add(1, std::memory_order_relaxed);
    LOG_TRACE(log, "envelope has been delivered to {}", address.to_string());
    bus->emit(bus_event_kind_t::delivered, address, envelope->correlation_id);
    return {};
}

void router_t::give_up(const envelope_ptr_t &envelope, bus_event_kind_t kind,
                       const extended_error_ptr_t &reason) noexcept {
    if (kind == bus_event_kind_t::expired) {
        LOG_WARN(log, "envelope has been expired: {}", reason->message());
    } else {
        LOG_ERROR(log, "envelope is undeliverable: {}", reason->message());
    }
    bus->emit(kind, envelope->recipient, envelope->correlation_id, reason);
    dead_letters.push(dead_letter_t{envelope, reason, utc_now()});
}
