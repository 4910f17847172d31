//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/actor_base.h"
#include "stator/system_context.h"

using namespace stator;

actor_base_t::actor_base_t(system_context_t &system_context_, const address_t &address_) noexcept
    : actor_base_t(system_context_, address_, system_context_.make_mailbox()) {}

actor_base_t::actor_base_t(system_context_t &system_context_, const address_t &address_,
                           mailbox_ptr_t mailbox_) noexcept
    : system_context{system_context_}, address{address_}, mailbox{std::move(mailbox_)},
      bus{system_context_.get_bus()}, log{get_logger("stator.actor")}, strand{system_context_.get_io_context()} {}

extended_error_ptr_t actor_base_t::on_start() noexcept { return {}; }

void actor_base_t::on_stop() noexcept {}

extended_error_ptr_t actor_base_t::start() noexcept {
    if (mailbox->is_closed()) {
        return make_error(address.to_string(), error_code_t::mailbox_closed);
    }
    auto ee = on_start();
    if (ee) {
        return ee;
    }
    ee = system_context.get_registry().register_mailbox(address, mailbox);
    if (ee) {
        on_stop();
        return ee;
    }
    active.store(true, std::memory_order_release);
    auto self = intrusive_ptr_t<actor_base_t>(this);
    mailbox->set_listener([self = std::move(self)]() { self->schedule(); });
    LOG_DEBUG(log, "{} has been started", address.to_string());
    schedule();
    return {};
}

void actor_base_t::schedule() noexcept {
    if (!scheduled.exchange(true)) {
        auto self = intrusive_ptr_t<actor_base_t>(this);
        asio::post(strand, [self = std::move(self)]() { self->process(); });
    }
}

void actor_base_t::process() noexcept {
    scheduled.store(false);
    while (is_active()) {
        auto envelope = mailbox->try_receive();
        if (!envelope) {
            break;
        }
        auto ee = on_message(*envelope);
        processed.fetch_add(1, std::memory_order_relaxed);
        if (ee) {
            active.store(false, std::memory_order_release);
            LOG_ERROR(log, "{} has failed: {}", address.to_string(), ee->message());
            report_failure(make_error(address.to_string(), ee->ec, ee));
        }
    }
}

void actor_base_t::detach() noexcept {
    active.store(false, std::memory_order_release);
    mailbox->close();
    auto ee = system_context.get_registry().unregister(address, mailbox.get());
    if (ee) {
        LOG_DEBUG(log, "{}: {}", address.to_string(), ee->message());
    }
}

extended_error_ptr_t actor_base_t::stop(const pt::time_duration &) noexcept {
    detach();
    on_stop();
    LOG_DEBUG(log, "{} has been stopped, processed {} message(s)", address.to_string(), get_processed());
    return {};
}

void actor_base_t::terminate() noexcept {
    if (!mailbox->is_closed()) {
        detach();
        LOG_DEBUG(log, "{} has been terminated", address.to_string());
    }
}

extended_error_ptr_t actor_base_t::send(envelope_ptr_t envelope) noexcept {
    if (!envelope->sender) {
        envelope->sender = address;
    }
    return bus.publish(std::move(envelope));
}
