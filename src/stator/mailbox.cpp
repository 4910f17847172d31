//
// Copyright (c) 2019-2025 Ivan Baidakou (basiliscos) (the dot dmol at gmail dot com)
//
// Distributed under the MIT Software License
//

#include "stator/mailbox.h"
#include "stator/error_code.h"
#include "stator/detail/chrono.h"

namespace stator {

backpressure_t backpressure_for(priority_t priority) noexcept {
    switch (priority) {
    case priority_t::critical:
    case priority_t::high:
        return backpressure_t::block;
    case priority_t::normal:
        return backpressure_t::error;
    case priority_t::low:
        return backpressure_t::drop;
    }
    return backpressure_t::error;
}

mailbox_t::mailbox_t(std::size_t capacity_, backpressure_t backpressure_) noexcept
    : capacity{capacity_}, backpressure{backpressure_} {}

bool mailbox_t::has_space() const noexcept { return !capacity || queue.size() < capacity; }

extended_error_ptr_t mailbox_t::send(envelope_ptr_t envelope, const pt::time_duration &timeout) noexcept {
    listener_t notify;
    {
        lock_t lock(mutex);
        if (closed) {
            return make_error("mailbox", error_code_t::mailbox_closed);
        }
        if (!has_space()) {
            auto reaction = backpressure;
            if (reaction == backpressure_t::adaptive) {
                reaction = backpressure_for(envelope->priority);
            }
            switch (reaction) {
            case backpressure_t::drop:
                dropped.fetch_add(1, std::memory_order_relaxed);
                return {};
            case backpressure_t::error:
            case backpressure_t::adaptive:
                return make_error("mailbox", error_code_t::mailbox_full);
            case backpressure_t::block: {
                auto predicate = [&]() { return closed || has_space(); };
                if (detail::is_unbounded(timeout)) {
                    not_full.wait(lock, predicate);
                } else if (!not_full.wait_for(lock, detail::to_chrono(timeout), predicate)) {
                    return make_error("mailbox", error_code_t::send_timeout);
                }
                if (closed) {
                    return make_error("mailbox", error_code_t::mailbox_closed);
                }
                break;
            }
            }
        }
        queue.emplace_back(std::move(envelope));
        received.fetch_add(1, std::memory_order_relaxed);
        notify = listener;
    }
    not_empty.notify_one();
    if (notify) {
        notify();
    }
    return {};
}

envelope_ptr_t mailbox_t::try_receive() noexcept {
    envelope_ptr_t envelope;
    {
        lock_t lock(mutex);
        if (queue.empty()) {
            return {};
        }
        envelope = std::move(queue.front());
        queue.pop_front();
    }
    not_full.notify_one();
    return envelope;
}

envelope_ptr_t mailbox_t::receive(const pt::time_duration &timeout) noexcept {
    envelope_ptr_t envelope;
    {
        lock_t lock(mutex);
        auto predicate = [&]() { return closed || !queue.empty(); };
        if (detail::is_unbounded(timeout)) {
            not_empty.wait(lock, predicate);
        } else {
            not_empty.wait_for(lock, detail::to_chrono(timeout), predicate);
        }
        if (queue.empty()) {
            return {};
        }
        envelope = std::move(queue.front());
        queue.pop_front();
    }
    not_full.notify_one();
    return envelope;
}

void mailbox_t::close() noexcept {
    {
        lock_t lock(mutex);
        closed = true;
        listener = {};
    }
    not_empty.notify_all();
    not_full.notify_all();
}

bool mailbox_t::is_closed() const noexcept {
    lock_t lock(mutex);
    return closed;
}

std::size_t mailbox_t::size() const noexcept {
    lock_t lock(mutex);
    return queue.size();
}

void mailbox_t::set_listener(listener_t listener_) noexcept {
    lock_t lock(mutex);
    listener = std::move(listener_);
}

} // namespace stator
